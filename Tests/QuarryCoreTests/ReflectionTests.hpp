#pragma once

#include "TestModels.hpp"
#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace reflection_tests {

using namespace test_models;
using quarry::member_access;

// Accessor shapes the resolution rules have to handle.

struct Flagged {
    bool value = false;
    bool getValue() const { return value; }
    bool isValue() const { return value; }
};

struct Mixed {
    int64_t code = 0;
    int64_t codeAsNumber() const { return code; }
    std::string codeAsText() const { return std::to_string(code); }
};

struct Account {
    std::string id;
    std::string getId() const { return id; }
    void setIdNumber(int64_t v) { id = "n" + std::to_string(v); }
    void setIdReal(double v) { id = "r" + std::to_string(v); }
    void setIdText(const std::string& v) { id = v; }
};

struct Loose {
    std::string value;
    void setValueNumber(int64_t v) { value = std::to_string(v); }
    void setValueText(const std::string& v) { value = v; }
};

struct Shelter {
    std::string resident;
    void setResidentAnimal(const Animal& a) { resident = "animal:" + a.name; }
    void setResidentDog(const Dog& d) { resident = "dog:" + d.name; }
};

struct Record {
    int64_t id = 0;
    const std::string code = "R-1";
    std::string secret;
    std::string label;
    int64_t serialVersionUID = 1;
    int64_t jacocoData = 0;

    static inline int64_t counter = 0;
    static constexpr int64_t VERSION = 3;

    std::string getLabel() const { return "label:" + label; }
    std::string getClassName() const { return "Record"; }
};

struct Sealed {
    int value;
    explicit Sealed(int v) : value(v) {}
};

struct Hidden {
    int value = 7;
};

// ============================================================================
// test_property_namer: accessor names to property names
// ============================================================================

void test_property_namer() {
    std::cout << "  test_property_namer..." << std::flush;

    namespace namer = quarry::property_namer;
    assert(namer::method_to_property("getName") == "name");
    assert(namer::method_to_property("isGood") == "good");
    assert(namer::method_to_property("setId") == "id");
    assert(namer::method_to_property("getX") == "x");
    assert(namer::method_to_property("getURL") == "URL");

    assert(namer::is_getter("getName"));
    assert(namer::is_getter("isOpen"));
    assert(!namer::is_getter("get"));
    assert(!namer::is_getter("is"));
    assert(namer::is_setter("setX"));
    assert(!namer::is_setter("set"));
    assert(!namer::is_property("name"));

    bool threw = false;
    try {
        namer::method_to_property("name");
    } catch (const quarry::reflection_error& e) {
        threw = std::string(e.what()).find("Didn't start with 'is', 'get' or 'set'") != std::string::npos;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_inherited_accessors: supertype accessors resolve on the subtype
// ============================================================================

void test_inherited_accessors() {
    std::cout << "  test_inherited_accessors..." << std::flush;

    model_fixture f;
    auto meta = f.registry.find_for_type<Dog>();

    assert(meta->has_getter("name"));
    assert(meta->has_setter("name"));
    assert(meta->has_getter("good"));
    assert(&meta->getter_type("name") == &f.types.ensure<std::string>());
    assert(&meta->getter_type("good") == &f.types.ensure<bool>());

    Dog rex("Rex");
    std::vector<std::any> args{std::string("Fido")};
    meta->set_invoker("name").invoke(&rex, args);
    assert(rex.name == "Fido");

    std::vector<std::any> none;
    assert(std::any_cast<std::string>(meta->get_invoker("name").invoke(&rex, none)) == "Fido");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_covariant_getter: the most specific return type wins
// ============================================================================

void test_covariant_getter() {
    std::cout << "  test_covariant_getter..." << std::flush;

    model_fixture f;
    auto meta = f.registry.find_for_type<DogKennel>();

    assert(&meta->getter_type("resident") == &f.types.ensure<Dog>());

    DogKennel kennel;
    kennel.dog = Dog("Rex");
    kennel.resident = Animal("Generic");
    std::vector<std::any> args;
    std::any resident = meta->get_invoker("resident").invoke(&kennel, args);
    assert(std::any_cast<Dog>(resident).name == "Rex");

    // The base type alone keeps its own declaration
    assert(&f.registry.find_for_type<Kennel>()->getter_type("resident") == &f.types.ensure<Animal>());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_ambiguous_getters: equal or unrelated return types are rejected
// ============================================================================

void test_ambiguous_getters() {
    std::cout << "  test_ambiguous_getters..." << std::flush;

    model_fixture f;
    f.types.describe<Flagged>("Flagged")
        .method("getValue", &Flagged::getValue)
        .method("isValue", &Flagged::isValue);
    f.types.describe<Mixed>("Mixed")
        .method("getCode", &Mixed::codeAsNumber)
        .method("getCode", &Mixed::codeAsText);

    bool threw = false;
    try {
        f.registry.find_for_type<Flagged>();
    } catch (const quarry::reflection_error& e) {
        threw = std::string(e.what()).find(
            "Illegal overloaded getter method with ambiguous type for property value") != std::string::npos;
    }
    assert(threw);

    threw = false;
    try {
        f.registry.find_for_type<Mixed>();
    } catch (const quarry::reflection_error& e) {
        threw = std::string(e.what()).find("property code in class Mixed") != std::string::npos;
    }
    assert(threw);

    // Nothing is cached for a type that failed to resolve
    assert(f.registry.size() == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_setter_matching_getter_type: exact getter type beats earlier conflicts
// ============================================================================

void test_setter_matching_getter_type() {
    std::cout << "  test_setter_matching_getter_type..." << std::flush;

    model_fixture f;
    f.types.describe<Account>("Account")
        .method("getId", &Account::getId)
        .method("setId", &Account::setIdNumber)
        .method("setId", &Account::setIdReal)
        .method("setId", &Account::setIdText);

    auto meta = f.registry.find_for_type<Account>();
    assert(&meta->setter_type("id") == &f.types.ensure<std::string>());

    Account account;
    std::vector<std::any> args{std::string("A-1")};
    meta->set_invoker("id").invoke(&account, args);
    assert(account.id == "A-1");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_ambiguous_setters: unrelated parameter types without a getter
// ============================================================================

void test_ambiguous_setters() {
    std::cout << "  test_ambiguous_setters..." << std::flush;

    model_fixture f;
    f.types.describe<Loose>("Loose")
        .method("setValue", &Loose::setValueNumber)
        .method("setValue", &Loose::setValueText);

    bool threw = false;
    try {
        f.registry.find_for_type<Loose>();
    } catch (const quarry::reflection_error& e) {
        threw = std::string(e.what()).find("Ambiguous setters defined for property 'value'") != std::string::npos;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_setter_narrowing: related parameter types pick the subtype
// ============================================================================

void test_setter_narrowing() {
    std::cout << "  test_setter_narrowing..." << std::flush;

    model_fixture f;
    f.types.describe<Shelter>("Shelter")
        .method("setResident", &Shelter::setResidentAnimal)
        .method("setResident", &Shelter::setResidentDog);

    auto meta = f.registry.find_for_type<Shelter>();
    assert(&meta->setter_type("resident") == &f.types.ensure<Dog>());
    assert(!meta->has_getter("resident"));

    Shelter shelter;
    std::vector<std::any> args{Dog("Rex")};
    meta->set_invoker("resident").invoke(&shelter, args);
    assert(shelter.resident == "dog:Rex");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_field_accessors: fields fill in where no accessor method exists
// ============================================================================

void test_field_accessors() {
    std::cout << "  test_field_accessors..." << std::flush;

    model_fixture f;
    f.types.describe<Record>("Record")
        .field("id", &Record::id)
        .field("code", &Record::code)
        .field("secret", &Record::secret, member_access::private_access)
        .field("label", &Record::label)
        .field("serialVersionUID", &Record::serialVersionUID)
        .field("$jacocoData", &Record::jacocoData)
        .static_field("counter", &Record::counter)
        .static_field("VERSION", &Record::VERSION)
        .method("getLabel", &Record::getLabel)
        .method("getClass", &Record::getClassName);

    auto meta = f.registry.find_for_type<Record>();
    Record record;
    std::vector<std::any> none;

    // Plain field
    std::vector<std::any> id_arg{int64_t{42}};
    meta->set_invoker("id").invoke(&record, id_arg);
    assert(record.id == 42);
    assert(std::any_cast<int64_t>(meta->get_invoker("id").invoke(&record, none)) == 42);

    // Final instance field: readable, setter exists but refuses
    assert(meta->has_getter("code"));
    assert(meta->has_setter("code"));
    bool threw = false;
    try {
        std::vector<std::any> code_arg{std::string("R-2")};
        meta->set_invoker("code").invoke(&record, code_arg);
    } catch (const quarry::reflection_error&) {
        threw = true;
    }
    assert(threw);

    // Static fields, the final one read-only
    std::vector<std::any> counter_arg{int64_t{5}};
    meta->set_invoker("counter").invoke(nullptr, counter_arg);
    assert(Record::counter == 5);
    assert(std::any_cast<int64_t>(meta->get_invoker("VERSION").invoke(nullptr, none)) == 3);
    assert(!meta->has_setter("VERSION"));

    // Getter method wins over the field, the field still provides the setter
    std::vector<std::any> label_arg{std::string("x")};
    meta->set_invoker("label").invoke(&record, label_arg);
    assert(std::any_cast<std::string>(meta->get_invoker("label").invoke(&record, none)) == "label:x");

    // Reserved names never become properties
    assert(!meta->has_getter("serialVersionUID"));
    assert(!meta->has_getter("$jacocoData"));
    assert(!meta->has_getter("class"));

    // Private members are visible only when the registry allows it
    assert(meta->has_getter("secret"));
    quarry::metadata_registry strict(f.types, false);
    assert(!strict.find_for_type<Record>()->has_getter("secret"));
    assert(strict.find_for_type<Record>()->has_getter("id"));

    std::set<std::string> readable(meta->getable_property_names().begin(), meta->getable_property_names().end());
    assert((readable == std::set<std::string>{"VERSION", "code", "counter", "id", "label", "secret"}));

    Record::counter = 0;
    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_case_insensitive_lookup
// ============================================================================

void test_case_insensitive_lookup() {
    std::cout << "  test_case_insensitive_lookup..." << std::flush;

    model_fixture f;
    auto meta = f.registry.find_for_type<Blog>();

    assert(meta->find_property_name("TITLE") == std::optional<std::string>("title"));
    assert(meta->find_property_name("Author") == std::optional<std::string>("author"));
    assert(!meta->find_property_name("subtitle").has_value());

    bool threw = false;
    try {
        meta->get_invoker("subtitle");
    } catch (const quarry::property_not_found_error& e) {
        threw = std::string(e.what()) == "There is no getter for property named 'subtitle' in 'Blog'";
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_default_constructor: absent, private and public zero-argument ctors
// ============================================================================

void test_default_constructor() {
    std::cout << "  test_default_constructor..." << std::flush;

    model_fixture f;
    f.types.describe<Sealed>("Sealed").field("value", &Sealed::value);
    f.types.describe<Hidden>("Hidden")
        .field("value", &Hidden::value)
        .default_constructor(member_access::private_access);

    auto sealed = f.registry.find_for_type<Sealed>();
    assert(!sealed->has_default_constructor());
    bool threw = false;
    try {
        sealed->default_constructor();
    } catch (const quarry::construction_error& e) {
        threw = std::string(e.what()) == "There is no default constructor for Sealed";
    }
    assert(threw);

    auto hidden = f.registry.find_for_type<Hidden>();
    assert(hidden->has_default_constructor());
    std::any created = hidden->default_constructor().create();
    assert(std::any_cast<std::shared_ptr<Hidden>>(created)->value == 7);

    quarry::metadata_registry strict(f.types, false);
    assert(!strict.find_for_type<Hidden>()->has_default_constructor());

    assert(f.registry.find_for_type<Author>()->has_default_constructor());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_metadata_registry_cache: memoized per type, switchable
// ============================================================================

void test_metadata_registry_cache() {
    std::cout << "  test_metadata_registry_cache..." << std::flush;

    model_fixture f;
    auto first = f.registry.find_for_type<Dog>();
    auto second = f.registry.find_for_type<Dog>();
    assert(first == second);
    assert(f.registry.size() == 1);

    f.registry.set_cache_enabled(false);
    auto fresh = f.registry.find_for_type<Dog>();
    assert(fresh != first);
    assert(fresh->getable_property_names() == first->getable_property_names());

    f.registry.set_cache_enabled(true);
    f.registry.clear();
    assert(f.registry.size() == 0);

    // Concurrent first lookups all see a complete result
    std::vector<std::thread> threads;
    std::vector<std::shared_ptr<const quarry::property_metadata>> results(8);
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&f, &results, i] {
            results[i] = f.registry.find_for_type<Blog>();
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    for (const auto& meta : results) {
        assert(meta && meta->has_getter("author"));
    }
    assert(f.registry.size() == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_type_conversion: upcasts and scalar widening
// ============================================================================

void test_type_conversion() {
    std::cout << "  test_type_conversion..." << std::flush;

    model_fixture f;
    const auto& types = f.types;

    std::any widened = types.convert(std::any(7), f.types.ensure<int64_t>());
    assert(std::any_cast<int64_t>(widened) == 7);

    std::any sliced = types.convert(std::any(Dog("Rex")), f.types.ensure<Animal>());
    assert(std::any_cast<Animal>(sliced).name == "Rex");

    auto dog = std::make_shared<Dog>("Rex");
    std::any handle = types.convert(std::any(dog), f.types.ensure<std::shared_ptr<Animal>>());
    assert(std::any_cast<std::shared_ptr<Animal>>(handle).get() == dog.get());

    bool threw = false;
    try {
        types.convert(std::any(Dog("Rex")), f.types.ensure<Author>());
    } catch (const quarry::reflection_error& e) {
        threw = std::string(e.what()) == "Cannot assign a value of type Dog to type Author";
    }
    assert(threw);

    // UUIDs bind as text, timestamps as epoch seconds
    auto id = quarry::uuid_t::parse("550e8400-e29b-41d4-a716-446655440000");
    assert(id.has_value());
    quarry::column_value_t stored = types.to_column_value(std::any(*id));
    assert(std::get<std::string>(stored) == "550e8400-e29b-41d4-a716-446655440000");
    assert(std::any_cast<quarry::uuid_t>(types.from_column_value(stored, f.types.ensure<quarry::uuid_t>())) == *id);
    assert(!quarry::uuid_t::parse("not-a-uuid").has_value());

    quarry::timestamp_t when{std::chrono::milliseconds(1500)};
    quarry::column_value_t seconds = types.to_column_value(std::any(when));
    assert(std::get<double>(seconds) == 1.5);
    assert(std::any_cast<quarry::timestamp_t>(
               types.from_column_value(seconds, f.types.ensure<quarry::timestamp_t>())) == when);

    threw = false;
    try {
        types.from_column_value(std::string("zz"), f.types.ensure<quarry::uuid_t>());
    } catch (const quarry::reflection_error&) {
        threw = true;
    }
    assert(threw);

    assert(types.is_null(std::any(std::shared_ptr<Author>())));
    assert(types.is_scalar(std::any(std::string("x"))));
    assert(!types.is_scalar(std::any(Dog())));

    std::cout << " OK" << std::endl;
}

} // namespace reflection_tests
