#pragma once

#include "SqliteTests.hpp"
#include "TestModels.hpp"
#include <cassert>
#include <fstream>
#include <iostream>
#include <string>

namespace session_tests {

using namespace test_models;
using quarry::configuration;
using quarry::mapped_statement;
using quarry::parameter_mapping;
using quarry::session_factory;

inline std::string config_json(const std::string& database_path, const std::string& scope = "SESSION") {
    return R"({
        "settings": {
            "localCacheScope": ")" + scope + R"(",
            "defaultStatementTimeout": 5,
            "reflectionCacheEnabled": true,
            "logLevel": "warn"
        },
        "environment": { "id": "test", "database": ")" + database_path + R"(" }
    })";
}

inline void add_author_statements(configuration& config) {
    config.add_mapped_statement(mapped_statement::select(
        "selectAuthor", "SELECT id, name FROM author WHERE id = ?", {parameter_mapping("id")}, author_mapper()));
    config.add_mapped_statement(mapped_statement::select(
        "selectAll", "SELECT id, name FROM author ORDER BY id", {}, author_mapper()));
    config.add_mapped_statement(mapped_statement::insert(
        "insertAuthor", "INSERT INTO author (id, name) VALUES (?, ?)",
        {parameter_mapping("id"), parameter_mapping("name")}));
    config.add_mapped_statement(mapped_statement::update(
        "renameAuthor", "UPDATE author SET name = ? WHERE id = ?",
        {parameter_mapping("name"), parameter_mapping("id")}));
    config.add_mapped_statement(mapped_statement::remove(
        "deleteAuthor", "DELETE FROM author WHERE id = ?", {parameter_mapping("id")}));
    config.add_mapped_statement(mapped_statement::callable(
        "countAuthors", "SELECT COUNT(*) AS total FROM author WHERE id > ?",
        {parameter_mapping("minId"), parameter_mapping("total", quarry::parameter_mode::out)}));
}

inline std::shared_ptr<Author> make_author(int64_t id, const std::string& name) {
    auto author = std::make_shared<Author>();
    author->id = id;
    author->name = name;
    return author;
}

// ============================================================================
// test_configuration_settings: JSON settings, environment and validation
// ============================================================================

void test_configuration_settings() {
    std::cout << "  test_configuration_settings..." << std::flush;

    auto previous = quarry::get_log_level();
    configuration config = configuration::from_json(config_json("/tmp/quarry.db", "STATEMENT"));
    assert(config.cache_scope == quarry::local_cache_scope::statement);
    assert(config.default_statement_timeout == std::optional<int>(5));
    assert(config.reflection_cache_enabled);
    assert(config.logging_level == std::optional<quarry::log_level>(quarry::log_level::warn));
    assert(config.env.has_value());
    assert(config.env->id() == "test");
    assert(config.env->database_path() == "/tmp/quarry.db");
    assert(quarry::get_log_level() == previous);  // applied by the session factory, not here

    auto expect_config_error = [](const std::string& json, const std::string& fragment) {
        bool threw = false;
        try {
            configuration::from_json(json);
        } catch (const quarry::config_error& e) {
            threw = std::string(e.what()).find(fragment) != std::string::npos;
        }
        assert(threw);
    };
    expect_config_error(R"({"settings": {"cacheEnabled": true}})",
                        "The setting cacheEnabled is not known. Make sure you spelled it correctly (case sensitive).");
    expect_config_error(R"({"settings": {"localCacheScope": "GLOBAL"}})", "localCacheScope");
    expect_config_error(R"({"settings": {"logLevel": "loud"}})", "loud");
    expect_config_error(R"({"settings": {"defaultStatementTimeout": "soon"}})", "Error parsing configuration");
    expect_config_error(R"({"environment": {"id": "", "database": "x.db"}})", "Environment requires an id.");
    expect_config_error("{not json", "Error parsing configuration");

    quarry::set_log_level(quarry::log_level::warn);
    assert(quarry::log_enabled(quarry::log_level::error));
    assert(!quarry::log_enabled(quarry::log_level::info));
    assert(!quarry::log_enabled(quarry::log_level::off));
    assert(quarry::parse_log_level("debug") == quarry::log_level::debug);
    assert(std::string(quarry::log_level_name(quarry::log_level::info)) == "info");
    quarry::set_log_level(previous);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_configuration_from_file_and_statements
// ============================================================================

void test_configuration_from_file_and_statements() {
    std::cout << "  test_configuration_from_file_and_statements..." << std::flush;

    temp_database tmp("config_file");
    std::string config_path = tmp.path + ".json";
    {
        std::ofstream out(config_path);
        out << config_json(tmp.path);
    }
    configuration config = configuration::from_file(config_path);
    std::filesystem::remove(config_path);
    assert(config.cache_scope == quarry::local_cache_scope::session);

    add_author_statements(config);
    assert(config.has_statement("selectAuthor"));
    assert(config.statement_ids().front() == "countAuthors");
    assert(config.get_mapped_statement("insertAuthor").flush_cache_required);
    assert(!config.get_mapped_statement("selectAll").flush_cache_required);

    bool threw = false;
    try {
        config.add_mapped_statement(mapped_statement::select("selectAll", "SELECT 1"));
    } catch (const quarry::config_error& e) {
        threw = std::string(e.what()) == "Mapped Statements collection already contains value for selectAll";
    }
    assert(threw);

    threw = false;
    try {
        config.get_mapped_statement("selectNothing");
    } catch (const quarry::config_error& e) {
        threw = std::string(e.what()) == "Mapped Statements collection does not contain value for selectNothing";
    }
    assert(threw);

    threw = false;
    try {
        configuration::from_file(config_path);
    } catch (const quarry::config_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_session_crud: writes, commit, cached reads
// ============================================================================

void test_session_crud() {
    std::cout << "  test_session_crud..." << std::flush;

    temp_database tmp("session_crud");
    sqlite_tests::create_authors(tmp.path, 0);
    model_fixture f;
    configuration config = configuration::from_json(config_json(tmp.path));
    add_author_statements(config);
    session_factory factory(config, f.registry);
    assert(quarry::get_log_level() == quarry::log_level::warn);

    {
        auto session = factory.open_session();
        assert(!session->is_auto_commit());
        assert(session->insert("insertAuthor", make_author(1, "Ada")) == 1);
        assert(session->insert("insertAuthor", make_author(2, "Grace")) == 1);
        assert(session->is_dirty());
        session->commit();
        assert(!session->is_dirty());
    }

    auto session = factory.open_session();
    std::any first = session->select_one("selectAuthor", int64_t{1});
    std::any again = session->select_one("selectAuthor", int64_t{1});
    auto ada = std::any_cast<std::shared_ptr<Author>>(first);
    assert(ada->name == "Ada");
    // Served from the local cache: the very same object
    assert(std::any_cast<std::shared_ptr<Author>>(again) == ada);

    assert(!session->select_one("selectAuthor", int64_t{42}).has_value());

    bool threw = false;
    try {
        session->select_one("selectAll");
    } catch (const quarry::quarry_error& e) {
        threw = std::string(e.what()) ==
                "Expected one result (or null) to be returned by selectOne(), but found: 2";
    }
    assert(threw);

    auto page = session->select_list("selectAll", {}, quarry::row_bounds(1, 1));
    assert(page.size() == 1);
    assert(std::any_cast<std::shared_ptr<Author>>(page.front())->name == "Grace");

    // An update invalidates the cached object
    assert(session->update("renameAuthor", make_author(1, "Countess")) == 1);
    auto renamed = std::any_cast<std::shared_ptr<Author>>(session->select_one("selectAuthor", int64_t{1}));
    assert(renamed != ada);
    assert(renamed->name == "Countess");

    assert(session->remove("deleteAuthor", int64_t{2}) == 1);
    assert(session->select_list("selectAll").size() == 1);
    session->commit();

    threw = false;
    try {
        session->select_list("selectNothing");
    } catch (const quarry::config_error&) {
        threw = true;
    }
    assert(threw);

    session->close();
    threw = false;
    try {
        session->select_list("selectAll");
    } catch (const quarry::executor_closed_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_session_rollback_on_close: uncommitted writes are discarded
// ============================================================================

void test_session_rollback_on_close() {
    std::cout << "  test_session_rollback_on_close..." << std::flush;

    temp_database tmp("session_rollback");
    sqlite_tests::create_authors(tmp.path, 1);
    model_fixture f;
    configuration config = configuration::from_json(config_json(tmp.path));
    add_author_statements(config);
    session_factory factory(config, f.registry);

    {
        auto session = factory.open_session();
        session->insert("insertAuthor", make_author(2, "Dropped"));
        session->close();
    }
    {
        auto session = factory.open_session();
        session->insert("insertAuthor", make_author(3, "Rolled back"));
        session->rollback();
        assert(!session->is_dirty());
        assert(session->select_list("selectAll").size() == 1);
    }
    {
        // Session destructor closes, and rolls back
        auto session = factory.open_session();
        session->insert("insertAuthor", make_author(4, "Destroyed"));
    }

    auto session = factory.open_session(true);
    assert(session->is_auto_commit());
    assert(session->select_list("selectAll").size() == 1);

    // Auto-commit writes stick without a commit
    session->insert("insertAuthor", make_author(5, "Kept"));
    session->close();
    assert(factory.open_session()->select_list("selectAll").size() == 2);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_session_cursor_handler_and_callable
// ============================================================================

void test_session_cursor_handler_and_callable() {
    std::cout << "  test_session_cursor_handler_and_callable..." << std::flush;

    temp_database tmp("session_streams");
    sqlite_tests::create_authors(tmp.path, 5);
    model_fixture f;
    configuration config = configuration::from_json(config_json(tmp.path));
    add_author_statements(config);
    session_factory factory(config, f.registry);
    auto session = factory.open_session();

    auto cursor = session->select_cursor("selectAll");
    std::any row;
    int64_t count = 0;
    while (cursor->next(row)) {
        ++count;
    }
    assert(count == 5);
    assert(cursor->is_consumed());

    std::vector<std::string> names;
    session->select("selectAll", {}, {}, [&names](quarry::result_context& context) {
        names.push_back(std::any_cast<std::shared_ptr<Author>>(context.result_object())->name);
        if (names.size() == 2) context.stop();
    });
    assert((names == std::vector<std::string>{"author-1", "author-2"}));

    auto first = std::make_shared<quarry::param_map>(quarry::param_map{{"minId", int64_t{2}}});
    session->select_list("countAuthors", first);
    assert(std::any_cast<int64_t>(first->at("total")) == 3);

    // Cache hit: the store is not asked again, OUT values still arrive
    auto second = std::make_shared<quarry::param_map>(quarry::param_map{{"minId", int64_t{2}}});
    session->select_list("countAuthors", second);
    assert(std::any_cast<int64_t>(second->at("total")) == 3);
    assert(session->get_executor().local_result_cache().size() == 1);

    session->clear_cache();
    assert(session->get_executor().local_result_cache().empty());
    assert(session->flush_statements().empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_session_outlives_factory: sessions keep the configuration alive
// ============================================================================

void test_session_outlives_factory() {
    std::cout << "  test_session_outlives_factory..." << std::flush;

    temp_database tmp("session_outlives_factory");
    sqlite_tests::create_authors(tmp.path, 2);
    model_fixture f;

    std::unique_ptr<quarry::session> session;
    {
        configuration config = configuration::from_json(config_json(tmp.path));
        add_author_statements(config);
        session_factory factory(std::move(config), f.registry);
        session = factory.open_session();
    }

    assert(session->get_configuration().has_statement("selectAll"));
    assert(session->select_list("selectAll").size() == 2);
    auto author = std::any_cast<std::shared_ptr<Author>>(session->select_one("selectAuthor", int64_t{2}));
    assert(author->name == "author-2");
    session->close();

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_session_factory_errors
// ============================================================================

void test_session_factory_errors() {
    std::cout << "  test_session_factory_errors..." << std::flush;

    model_fixture f;

    session_factory no_environment(configuration(), f.registry);
    bool threw = false;
    try {
        no_environment.open_session();
    } catch (const quarry::config_error&) {
        threw = true;
    }
    assert(threw);

    // The connection only opens on first use, so a bad path surfaces there
    configuration config = configuration::from_json(config_json("/nonexistent/dir/quarry.db"));
    add_author_statements(config);
    session_factory factory(config, f.registry);
    auto session = factory.open_session();
    threw = false;
    try {
        session->select_list("selectAll");
    } catch (const quarry::db_error&) {
        threw = true;
    }
    assert(threw);

    configuration uncached = configuration::from_json(R"({"settings": {"reflectionCacheEnabled": false}})");
    session_factory disabling(uncached, f.registry);
    assert(!f.registry.is_cache_enabled());
    f.registry.set_cache_enabled(true);

    std::cout << " OK" << std::endl;
}

} // namespace session_tests
