// tests/test_struct_cache.cpp
/**
 * Unit Test: Struct Metadata Cache
 *
 * Test Coverage:
 *   1. Name resolution from tags and declared names (Implicit mode)
 *   2. Explicit mode skips untagged fields
 *   3. "-" tags, omitempty option and anonymous markers
 *   4. Tag name function overrides tags
 *   5. Custom function cached on the field descriptor
 *   6. Concurrent first use builds each type exactly once
 */

#include "urlform/struct_cache.hpp"
#include "test_common.hpp"
#include <atomic>
#include <cctype>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace urlform;

namespace {

struct Audit {
    std::string created_by;
    long revision = 0;
};

struct Account {
    std::string name;
    int age = 0;
    std::string secret;
    std::string nickname;
    std::unique_ptr<int> score;
    Audit audit;
};

}  // namespace

template <>
struct urlform::Reflect<Audit> {
    static void describe(FieldList<Audit>& f) {
        f.field("CreatedBy", &Audit::created_by);
        f.field("Revision", &Audit::revision).tag("form", "rev");
    }
};

template <>
struct urlform::Reflect<Account> {
    static void describe(FieldList<Account>& f) {
        f.field("Name", &Account::name).tag("form", "n").tag("json", "full_name");
        f.field("Age", &Account::age);
        f.field("Secret", &Account::secret).tag("form", "-");
        f.field("Nickname", &Account::nickname).tag("form", ",omitempty");
        f.field("Score", &Account::score).tag("form", "score");
        f.embed("Audit", &Account::audit);
    }
};

std::vector<std::string> names_of(const CachedStruct& cached) {
    std::vector<std::string> names;
    for (const auto& field : cached.fields) {
        names.push_back(field.name);
    }
    return names;
}

std::string join(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) out += ",";
        out += name;
    }
    return out;
}

// Test 1: Implicit mode
void test_implicit_names(TestResult& result) {
    std::cout << "\n=== Test 1: Implicit Mode Names ===\n";

    EncoderConfig config;
    StructCache cache(config);
    auto cached = cache.get_or_build(type_info_of<Account>());

    result.expect_eq(join(names_of(*cached)), "n,Age,Nickname,score,Audit",
                     "Tagged, untagged and anonymous fields in declaration order");
    result.check(cached->fields[2].index == 3, "Declaration index survives skipped fields");
    result.check(cached->fields[2].omit_empty, "omitempty option parsed from tag");
    result.check(!cached->fields[0].omit_empty, "No option means no omitempty");
    result.check(cached->fields[4].anonymous, "Embedded member marked anonymous");
    result.check(cached->type == &type_info_of<Account>(), "Entry points at its type");
}

// Test 2: Explicit mode
void test_explicit_mode(TestResult& result) {
    std::cout << "\n=== Test 2: Explicit Mode ===\n";

    EncoderConfig config;
    config.mode = Mode::Explicit;
    StructCache cache(config);
    auto cached = cache.get_or_build(type_info_of<Account>());

    // ",omitempty" counts as a tag; the name then falls back to the declared one
    result.expect_eq(join(names_of(*cached)), "n,Nickname,score", "Only tagged fields remain");

    auto audit = cache.get_or_build(type_info_of<Audit>());
    result.expect_eq(join(names_of(*audit)), "rev", "Nested type resolved with the same rules");
}

// Test 3: Custom tag name
void test_custom_tag_name(TestResult& result) {
    std::cout << "\n=== Test 3: Tag Name Setting ===\n";

    EncoderConfig config;
    config.tag_name = "json";
    StructCache cache(config);
    auto cached = cache.get_or_build(type_info_of<Account>());

    result.check(cached->fields.size() == 6, "'form' tags ignored under another tag name");
    result.expect_eq(cached->fields[0].name, "full_name", "Name taken from 'json' tag");
    result.expect_eq(cached->fields[2].name, "Secret", "'-' under another tag name does not skip");
}

// Test 4: Tag name function
void test_tag_name_func(TestResult& result) {
    std::cout << "\n=== Test 4: Tag Name Function ===\n";

    std::atomic<int> calls{0};
    EncoderConfig config;
    config.tag_name_func = [&calls](const DeclaredField& field) -> std::string {
        ++calls;
        if (field.name == "Secret") {
            return "-";
        }
        std::string lower;
        for (char c : field.name) {
            lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        return lower;
    };

    StructCache cache(config);
    auto first = cache.get_or_build(type_info_of<Account>());
    auto second = cache.get_or_build(type_info_of<Account>());

    result.expect_eq(join(names_of(*first)), "name,age,nickname,score,audit",
                     "Function result used instead of tags");
    result.check(first == second, "Second lookup returns the cached entry");
    result.check(calls == 6, "Function called once per declared field");
}

// Test 5: Custom function on descriptor
void test_cached_custom_func(TestResult& result) {
    std::cout << "\n=== Test 5: Cached Custom Function ===\n";

    EncoderConfig config;
    config.custom_funcs.add<std::string>([](const ValueRef&) { return std::string("x"); });
    config.custom_funcs.add<int>([](const ValueRef&) { return std::string("i"); });
    StructCache cache(config);
    auto cached = cache.get_or_build(type_info_of<Account>());

    result.check(cached->fields[0].custom != nullptr, "string field carries its custom function");
    result.check(cached->fields[1].custom != nullptr, "int field carries its custom function");
    result.check(cached->fields[3].custom == nullptr, "Pointer-like field resolves at traversal time");
    result.check(cached->fields[4].custom == nullptr, "Unregistered type has no custom function");
}

// Test 6: Concurrent first use
void test_concurrent_build(TestResult& result) {
    std::cout << "\n=== Test 6: Concurrent First Use ===\n";

    std::atomic<int> builds{0};
    EncoderConfig config;
    config.hooks.add_struct_cached_hook([&builds](const std::string&, std::size_t) { ++builds; });
    StructCache cache(config);

    constexpr int kThreads = 8;
    std::vector<std::shared_ptr<const CachedStruct>> seen(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&cache, &seen, i] {
            for (int n = 0; n < 100; ++n) {
                seen[i] = cache.get_or_build(type_info_of<Account>());
                cache.get_or_build(type_info_of<Audit>());
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    bool same = true;
    for (const auto& entry : seen) {
        same = same && entry == seen[0];
    }

    result.check(builds == 2, "Each type built exactly once (" + std::to_string(builds.load()) + " builds)");
    result.check(same, "All threads observe the same entry");
    result.check(cache.size() == 2, "Cache holds two types");
    result.check(cache.find(type_info_of<Audit>().id) != nullptr, "find() sees a built type");
    result.check(cache.find(type_info_of<int>().id) == nullptr, "find() misses an unbuilt type");
}

int main() {
    std::cout << COLOR_YELLOW << "Struct Metadata Cache Tests" << COLOR_RESET << "\n";

    TestResult result;
    test_implicit_names(result);
    test_explicit_mode(result);
    test_custom_tag_name(result);
    test_tag_name_func(result);
    test_cached_custom_func(result);
    test_concurrent_build(result);

    result.summary();
    return result.exit_code();
}
