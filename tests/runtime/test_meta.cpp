#include <cassert>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "test_helpers.hpp"

using namespace MapFusion;
using namespace MapFusion::options;
using namespace TestHelpers;

// Non-aggregate with private state, registered explicitly
class Account {
    std::string owner_;
    long long   balance_ = 0;
    std::optional<std::string> note_;

    friend struct MapFusion::StructMeta<Account>;

public:
    Account() = default;
    Account(std::string owner, long long balance): owner_(std::move(owner)), balance_(balance) {}

    const std::string & owner() const { return owner_; }
    long long balance() const { return balance_; }
    const std::optional<std::string> & note() const { return note_; }
};

template<> struct MapFusion::StructMeta<Account> {
    using Fields = StructFields<
        Field<&Account::owner_, "owner">,
        Field<&Account::balance_, "balance", options::key<"cents">, options::defaulted>,
        Field<&Account::note_, "note">
    >;
};

// Aggregate left untouched, options attached from outside
struct Legacy {
    std::string first_name;
    int         internal_counter = 0;
    int         version = 1;
};

template<> struct MapFusion::AnnotatedField<Legacy, 0> {
    using Options = OptionsPack<options::key<"firstName">>;
};
template<> struct MapFusion::AnnotatedField<Legacy, 1> {
    using Options = OptionsPack<options::ignore>;
};
template<> struct MapFusion::AnnotatedField<Legacy, 2> {
    using Options = OptionsPack<options::defaulted>;
};
template<> struct MapFusion::Annotated<Legacy> {
    using Options = OptionsPack<options::strict, options::type_name<"LegacyRecord">>;
};

// Hand-written marshaling
struct Celsius {
    double degrees = 0;

    static FromMapResult<Celsius> from_map(const Map & m) {
        auto it = m.find("degrees");
        if(it != m.end()) {
            if(const double * d = it->second.getIf<double>()) {
                return Celsius{*d};
            }
            if(const std::int64_t * i = it->second.getIf<std::int64_t>()) {
                return Celsius{static_cast<double>(*i)};
            }
        }
        ErrorInfo info;
        info.error          = it == m.end() ? MarshalError::MISSING_REQUIRED_FIELD : MarshalError::TYPE_MISMATCH;
        info.typeName       = "Celsius";
        info.field          = "degrees";
        info.key            = "degrees";
        info.expectedType   = "Float";
        info.offendingValue = it == m.end() ? Value{} : it->second;
        info.path.push_child("degrees");
        return info;
    }

    Map to_map() const {
        return Map{{"degrees", degrees}, {"unit", "C"}};
    }
};

struct Reading {
    std::string            station;
    Celsius                temperature;
    std::optional<Celsius> dewPoint;
};

int main() {
    std::cout << "=== Meta Registration Tests ===\n\n";

    // Test 1: StructMeta
    {
        std::cout << "Test 1: StructMeta registered class... ";
        auto r = FromMap<Account>(Map{{"owner", "ann"}, {"cents", 1250}});
        assert(r);
        assert(r->owner() == "ann");
        assert(r->balance() == 1250);
        assert(!r->note().has_value());
        assert(ExportsAs(*r, Map{{"owner", "ann"}, {"cents", 1250}, {"note", nullptr}}));

        // defaulted keeps the constructor's value
        auto d = FromMap<Account>(Map{{"owner", "bob"}, {"note", "vip"}});
        assert(d && d->balance() == 0 && *d->note() == "vip");

        assert(ConstructFailsAt<Account>(Map{{"cents", 3}}, MarshalError::MISSING_REQUIRED_FIELD, "owner"));
        assert(RoundTrips(Account{"cy", 42}, [](const Account & a, const Account & b) {
            return a.owner() == b.owner() && a.balance() == b.balance() && a.note() == b.note();
        }));
        std::cout << "PASSED\n";
    }

    // Test 2: External field annotations
    {
        std::cout << "Test 2: AnnotatedField / Annotated<T>... ";
        auto r = FromMap<Legacy>(Map{{"firstName", "Ada"}});
        assert(r);
        assert(r->first_name == "Ada");
        assert(r->version == 1);
        assert(ExportsAs(*r, Map{{"firstName", "Ada"}, {"version", 1}}));

        auto strict = FromMap<Legacy>(Map{{"firstName", "Ada"}, {"internal_counter", 5}});
        assert(!strict);
        assert(strict.error() == MarshalError::UNKNOWN_KEY);
        assert(strict.typeName() == "LegacyRecord");
        std::cout << "PASSED\n";
    }

    // Test 3: Custom from_map / to_map
    {
        std::cout << "Test 3: Hand-written marshaling... ";
        auto c = FromMap<Celsius>(Map{{"degrees", 21}});
        assert(c && c->degrees == 21.0);

        auto r = FromMap<Reading>(Map{
            {"station", "roof"},
            {"temperature", Map{{"degrees", -4.5}}},
            {"dewPoint", nullptr},
        });
        assert(r);
        assert(r->temperature.degrees == -4.5);
        assert(!r->dewPoint.has_value());
        assert(ExportsAs(*r, Map{
            {"station", "roof"},
            {"temperature", Map{{"degrees", -4.5}, {"unit", "C"}}},
            {"dewPoint", nullptr},
        }));
        std::cout << "PASSED\n";
    }

    // Test 4: Errors from hand-written code keep their context
    {
        std::cout << "Test 4: Custom nested error path... ";
        auto r = FromMap<Reading>(Map{
            {"station", "roof"},
            {"temperature", Map{{"degrees", "cold"}}},
        });
        assert(!r);
        assert(r.error() == MarshalError::TYPE_MISMATCH);
        assert(r.typeName() == "Celsius");
        assert(r.field() == "degrees");
        assert(r.errorPath().toString() == "$.temperature.degrees");
        assert(r.offendingValue() == Value("cold"));

        // nilable does not rescue a failed nested construction
        auto dew = FromMap<Reading>(Map{
            {"station", "roof"},
            {"temperature", Map{{"degrees", 1}}},
            {"dewPoint", Map{}},
        });
        assert(!dew);
        assert(dew.error() == MarshalError::MISSING_REQUIRED_FIELD);
        assert(dew.errorPath().toString() == "$.dewPoint.degrees");
        std::cout << "PASSED\n";
    }

    std::cout << "\nAll meta registration tests passed!\n";
    return 0;
}
