#include <urlform/urlform.hpp>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

struct Address {
    std::string street;
    std::string city;
};

struct Signup {
    std::string name;
    int age = 0;
    std::vector<std::string> tags;
    std::map<std::string, int> scores;
    std::unique_ptr<Address> address;
    std::string referrer;
    std::string password;
};

template <>
struct urlform::Reflect<Address> {
    static void describe(FieldList<Address>& f) {
        f.field("Street", &Address::street).tag("form", "street");
        f.field("City", &Address::city).tag("form", "city");
    }
};

template <>
struct urlform::Reflect<Signup> {
    static void describe(FieldList<Signup>& f) {
        f.field("Name", &Signup::name).tag("form", "name");
        f.field("Age", &Signup::age).tag("form", "age");
        f.field("Tags", &Signup::tags).tag("form", "tags");
        f.field("Scores", &Signup::scores).tag("form", "scores");
        f.field("Address", &Signup::address).tag("form", "addr");
        f.field("Referrer", &Signup::referrer).tag("form", "ref,omitempty");
        f.field("Password", &Signup::password).tag("form", "-");
    }
};

int main() {
    try {
        urlform::Encoder encoder;

        Signup signup;
        signup.name = "Joey Bloggs";
        signup.age = 32;
        signup.tags = {"new", "beta"};
        signup.scores = {{"math", 90}, {"art", 75}};
        signup.address = std::make_unique<Address>(Address{"1 Main St", "Springfield"});
        signup.password = "hunter2";

        std::cout << "=== Encode ===" << "\n";
        auto result = encoder.encode(signup);
        result.throw_if_failed();

        for (const auto& [key, values] : result.values) {
            for (const auto& value : values) {
                std::cout << key << " = " << value << "\n";
            }
        }

        std::cout << "\n=== Query String ===" << "\n";
        std::cout << "Content-Type: " << urlform::FormValues::content_type() << "\n";
        std::cout << result.values.encode() << "\n";

        std::cout << "\n=== Nil Root ===" << "\n";
        std::shared_ptr<Signup> missing;
        try {
            encoder.encode(missing);
        } catch (const urlform::InvalidEncodeError& e) {
            std::cout << "Rejected: " << e.what() << "\n";
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
