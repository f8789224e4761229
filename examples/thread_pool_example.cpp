#include <urlform/urlform.hpp>
#include <asio.hpp>
#include <atomic>
#include <iostream>
#include <string>
#include <vector>

struct SearchQuery {
    std::string term;
    int page = 1;
    std::vector<std::string> filters;
};

template <>
struct urlform::Reflect<SearchQuery> {
    static void describe(FieldList<SearchQuery>& f) {
        f.field("Term", &SearchQuery::term).tag("form", "q");
        f.field("Page", &SearchQuery::page).tag("form", "page");
        f.field("Filters", &SearchQuery::filters).tag("form", "filter,omitempty");
    }
};

int main() {
    try {
        auto encoder = urlform::EncoderBuilder()
            .set_max_idle_workers(4)
            .build();

        constexpr int kQueries = 1000;
        std::vector<std::string> bodies(kQueries);
        std::atomic<int> failed{0};

        asio::thread_pool pool(4);
        for (int i = 0; i < kQueries; ++i) {
            asio::post(pool, [&, i] {
                SearchQuery query;
                query.term = "item " + std::to_string(i);
                query.page = i % 10 + 1;
                if (i % 3 == 0) {
                    query.filters = {"in-stock", "sale"};
                }

                auto result = encoder.encode(query);
                if (!result.ok()) {
                    ++failed;
                    return;
                }
                bodies[i] = result.values.encode();
            });
        }
        pool.join();

        std::cout << "=== Sample Bodies ===" << "\n";
        for (int i = 0; i < 3; ++i) {
            std::cout << bodies[i] << "\n";
        }

        auto stats = encoder.pool_stats();
        std::cout << "\n=== Pool Stats ===" << "\n";
        std::cout << "Failed: " << failed << "\n";
        std::cout << "Workers created: " << stats.created_workers << "\n";
        std::cout << "Idle workers: " << stats.idle_workers << "\n";
        std::cout << "Active workers: " << stats.active_workers << "\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
