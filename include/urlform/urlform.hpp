#pragma once

#include "custom_funcs.hpp"
#include "encoder.hpp"
#include "encoder_config.hpp"
#include "errors.hpp"
#include "form_values.hpp"
#include "hooks.hpp"
#include "namespace_builder.hpp"
#include "primitives.hpp"
#include "struct_cache.hpp"
#include "type_info.hpp"
#include "worker.hpp"
#include "worker_pool.hpp"
