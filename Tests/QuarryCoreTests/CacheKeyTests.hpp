#pragma once

#include "TestModels.hpp"
#include <cassert>
#include <iostream>
#include <string>
#include <unordered_set>

namespace cache_key_tests {

using quarry::cache_key;
using quarry::cached_result;
using quarry::column_value_t;

// ============================================================================
// test_equal_components_equal_keys: same values in the same order
// ============================================================================

void test_equal_components_equal_keys() {
    std::cout << "  test_equal_components_equal_keys..." << std::flush;

    cache_key a;
    a.update(std::string("selectAuthor"));
    a.update(int64_t{0});
    a.update(int64_t{10});
    a.update(nullptr);

    cache_key b({std::string("selectAuthor"), int64_t{0}, int64_t{10}, nullptr});

    assert(a == b);
    assert(a.hash_code() == b.hash_code());
    assert(std::hash<cache_key>{}(a) == std::hash<cache_key>{}(b));
    assert(a.count() == 4);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_order_matters: permuted components produce a different key
// ============================================================================

void test_order_matters() {
    std::cout << "  test_order_matters..." << std::flush;

    cache_key a({int64_t{1}, int64_t{2}});
    cache_key b({int64_t{2}, int64_t{1}});
    assert(a != b);

    // Same hash inputs, different types
    cache_key text({std::string("1")});
    cache_key number({int64_t{1}});
    assert(text != number);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_hash_formula: null components hash to 1
// ============================================================================

void test_hash_formula() {
    std::cout << "  test_hash_formula..." << std::flush;

    cache_key key;
    assert(key.hash_code() == 17);

    key.update(nullptr);
    assert(key.hash_code() == 37 * 17 + 1);

    key.update(nullptr);
    assert(key.hash_code() == 37 * (37 * 17 + 1) + 1);

    // Each component adds its own hash once, whatever its position
    cache_key first({int64_t{5}});
    uint64_t five = first.hash_code() - 37 * 17;
    cache_key second({nullptr, int64_t{5}});
    assert(second.hash_code() == 37 * (37 * 17 + 1) + five);

    assert(key.to_string() == std::to_string(key.hash_code()) + ":2:null:null");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_null_key_is_immutable
// ============================================================================

void test_null_key_is_immutable() {
    std::cout << "  test_null_key_is_immutable..." << std::flush;

    cache_key copy = cache_key::null_key();
    bool threw = false;
    try {
        copy.update(int64_t{1});
    } catch (const quarry::executor_error& e) {
        threw = std::string(e.what()) == "Not allowed to update a null cache key instance.";
    }
    assert(threw);
    assert(cache_key::null_key().count() == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_keys_in_hash_set: blobs and reals participate in hashing
// ============================================================================

void test_keys_in_hash_set() {
    std::cout << "  test_keys_in_hash_set..." << std::flush;

    std::unordered_set<cache_key> keys;
    keys.insert(cache_key({quarry::blob_t{1, 2, 3}}));
    keys.insert(cache_key({quarry::blob_t{1, 2, 3}}));
    keys.insert(cache_key({quarry::blob_t{3, 2, 1}}));
    keys.insert(cache_key({2.5}));
    assert(keys.size() == 3);

    assert(cache_key({quarry::blob_t{0xab, 0x01}}).to_string().find("x'ab01'") != std::string::npos);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_local_cache_states: absent, pending and materialized slots
// ============================================================================

void test_local_cache_states() {
    std::cout << "  test_local_cache_states..." << std::flush;

    quarry::local_cache cache("LocalCache");
    cache_key key({std::string("selectBlog"), int64_t{1}});

    assert(cache.get(key).is_absent());

    cache.put(key, cached_result::placeholder());
    assert(cache.get(key).is_pending());
    bool threw = false;
    try {
        (void)cache.get(key).rows();
    } catch (const quarry::executor_error&) {
        threw = true;
    }
    assert(threw);

    // Present but empty is not the same as pending
    cache.put(key, cached_result::of({}));
    assert(cache.get(key).is_materialized());
    assert(cache.get(key).rows().empty());

    cache.put(key, cached_result::of({std::any(std::string("row"))}));
    assert(cache.get(key).rows().size() == 1);

    // Storing an absent result removes the slot
    cache.put(key, cached_result());
    assert(cache.empty());

    cache.put(key, cached_result::of({}));
    cache.put_output_parameters(key, std::any(int64_t{5}));
    assert(cache.output_parameters(key) != nullptr);
    cache.clear();
    assert(cache.size() == 0);
    assert(cache.output_parameters(key) == nullptr);

    std::cout << " OK" << std::endl;
}

} // namespace cache_key_tests
