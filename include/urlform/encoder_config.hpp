#pragma once

#include "custom_funcs.hpp"
#include "hooks.hpp"
#include "type_info.hpp"
#include <cstddef>
#include <functional>
#include <string>

namespace urlform {

// Whether untagged fields are encoded under their declared name
enum class Mode {
    Implicit,
    Explicit
};

// Whether anonymous fields are flattened into their parent
enum class AnonymousMode {
    Embed,
    Separate
};

// Resolves a field's name; the result is cached per type so it must be stable
using TagNameFunc = std::function<std::string(const DeclaredField&)>;

struct EncoderConfig {
    std::string tag_name{"form"};
    Mode mode{Mode::Implicit};
    AnonymousMode anonymous_mode{AnonymousMode::Embed};

    // When set, replaces tag lookup entirely
    TagNameFunc tag_name_func;

    CustomFuncRegistry custom_funcs;

    HookChain hooks;

    // Traversal limits
    std::size_t max_depth{128};

    // Worker pool settings
    std::size_t max_idle_workers{16};
    std::size_t namespace_capacity{64};  // initial key buffer size per worker
};

}  // namespace urlform
