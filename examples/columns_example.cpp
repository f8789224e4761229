#include <urlform/urlform.hpp>
#include <any>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

// Minor units; formatted by a registered function
struct Money {
    long cents = 0;
};

// Not reflected and not registered: reported as a field error
struct Opaque {
    int handle = 0;
};

struct Invoice {
    std::string number;
    Money total;
    std::chrono::system_clock::time_point issued;
    std::vector<double> lines;
    Opaque attachment;
};

template <>
struct urlform::Reflect<Invoice> {
    static void describe(FieldList<Invoice>& f) {
        f.field("Number", &Invoice::number).tag("form", "number");
        f.field("Total", &Invoice::total).tag("form", "total");
        f.field("Issued", &Invoice::issued).tag("form", "issued");
        f.field("Lines", &Invoice::lines).tag("form", "lines");
        f.field("Attachment", &Invoice::attachment).tag("form", "attachment");
    }
};

int main() {
    try {
        auto logger = [](const std::string& msg) {
            std::cout << "[urlform] " << msg << "\n";
        };

        auto encoder = urlform::EncoderBuilder()
            .register_type_func<Money>([](const Money& m) {
                std::ostringstream out;
                out << m.cents / 100 << "." << std::setw(2) << std::setfill('0') << m.cents % 100;
                return out.str();
            })
            .on_field_error(urlform::hooks::log_field_errors(logger))
            .on_struct_cached(urlform::hooks::log_struct_cache(logger))
            .build();

        Invoice invoice;
        invoice.number = "INV-1042";
        invoice.total = Money{129950};
        invoice.issued = std::chrono::sys_days{std::chrono::year{2024} / 3 / 15};
        invoice.lines = {99.5, 30.0, 0.45};

        std::cout << "=== Columns ===" << "\n";
        auto result = encoder.encode_with_columns(invoice);
        for (const auto& column : result.columns) {
            std::cout << column << " = " << result.values.get(column) << "\n";
        }

        std::cout << "\n=== Errors ===" << "\n";
        if (!result.ok()) {
            std::cout << result.errors.message() << "\n";
        }

        std::cout << "\n=== Natives ===" << "\n";
        urlform::NativeValues natives;
        encoder.encode(invoice, natives);
        for (const auto& [key, value] : natives) {
            std::cout << key << " holds " << urlform::detail::demangle(value.type().name()) << "\n";
        }

        std::cout << "\n=== Throwing ===" << "\n";
        try {
            result.throw_if_failed();
        } catch (const urlform::EncodeError& e) {
            std::cout << "Failed paths: " << e.errors().size() << "\n";
        }

        std::cout << "\nCached struct types: " << encoder.cached_struct_count() << "\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
