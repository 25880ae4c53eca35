#pragma once

#include <TesseraCore.hpp>
#include <cassert>
#include <limits>
#include <iostream>
#include <sstream>

namespace filter_tests {

using tessera::filter;
using tessera::sort_spec;
using json = nlohmann::json;

std::string compile(const filter& f, std::vector<tessera::column_value_t>& params) {
    std::ostringstream sql;
    f.to_sql(sql, params);
    return sql.str();
}

// ============================================================================
// test_filter_parse - object syntax builds the predicate tree
// ============================================================================

void test_filter_parse() {
    std::cout << "  test_filter_parse..." << std::flush;

    assert(filter::parse(json(nullptr)).is_null());
    assert(filter::parse(json::object()).kind() == filter::op::all);

    auto eq = filter::parse({{"title", "Dune"}});
    assert(eq.kind() == filter::op::eq);
    assert(eq.field() == "title");
    assert(eq.value() == "Dune");

    auto range = filter::parse({{"edition", {{"$gte", 2}, {"$lt", 5}}}});
    assert(range.kind() == filter::op::all_of);
    assert(range.children().size() == 2);

    auto either = filter::parse(json::parse(R"({"$or": [{"title": "Dune"}, {"__t": "PaperBook"}]})"));
    assert(either.kind() == filter::op::any_of);
    assert(either.children()[1].field() == "__t");

    auto in = filter::parse(json::parse(R"({"isbn": {"$in": ["1", "2"]}})"));
    assert(in.kind() == filter::op::in);
    assert(in.value().size() == 2);

    bool threw = false;
    try {
        filter::parse({{"title", {{"$regex", "D.*"}}}});
    } catch (const tessera::invalid_argument_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        filter::parse(json::array());
    } catch (const tessera::invalid_argument_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_filter_sql - values are bound, field names are checked
// ============================================================================

void test_filter_sql() {
    std::cout << "  test_filter_sql..." << std::flush;

    std::vector<tessera::column_value_t> params;
    auto sql = compile(filter::eq("title", "Dune"), params);
    assert(sql == "json_extract(doc, '$.\"title\"') = ?");
    assert(params.size() == 1);
    assert(std::get<std::string>(params[0]) == "Dune");

    params.clear();
    assert(compile(filter::eq("id", "abc"), params) == "id = ?");

    params.clear();
    assert(compile(filter::eq("format", nullptr), params) == "json_extract(doc, '$.\"format\"') IS NULL");
    assert(params.empty());

    params.clear();
    compile(filter::any_of({filter::eq("is_deleted", true), filter::gt("edition", 1)}), params);
    assert(params.size() == 2);
    assert(std::get<int64_t>(params[0]) == 1);

    params.clear();
    assert(compile(filter::in("isbn", {}), params) == "0");

    bool threw = false;
    try {
        filter::eq("title'); DROP TABLE books; --", "x");
    } catch (const tessera::invalid_argument_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        params.clear();
        compile(filter::null(), params);
    } catch (const tessera::invalid_argument_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_sort_spec - keys keep their order, storage order breaks ties
// ============================================================================

void test_sort_spec() {
    std::cout << "  test_sort_spec..." << std::flush;

    auto spec = sort_spec::by("title").then("edition", false);
    assert(spec.keys().size() == 2);
    assert(spec.keys()[1].field == "edition");
    assert(!spec.keys()[1].ascending);

    std::ostringstream sql;
    spec.to_sql(sql);
    assert(sql.str() == "json_extract(doc, '$.\"title\"') ASC, json_extract(doc, '$.\"edition\"') DESC, seq ASC");

    auto parsed = sort_spec::parse(json::parse(R"({"edition": -1, "title": "asc"})"));
    assert(parsed.keys().size() == 2);

    auto descending = sort_spec::parse("-title");
    assert(descending.keys().size() == 1);
    assert(descending.keys()[0].field == "title");
    assert(!descending.keys()[0].ascending);

    bool threw = false;
    try {
        sort_spec::parse({{"title", 2}});
    } catch (const tessera::invalid_argument_error&) {
        threw = true;
    }
    assert(threw);

    tessera::pageable page{2, 10};
    assert(page.is_paged());
    assert(page.skip() == 10);
    tessera::pageable no_page{0, 10};
    tessera::pageable no_size{2, 0};
    assert(!no_page.is_paged());
    assert(!no_size.is_paged());
    tessera::pageable far_page{std::numeric_limits<int64_t>::max(), 3};
    assert(far_page.skip() == std::numeric_limits<int64_t>::max());

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing filters and sorting..." << std::endl;
    test_filter_parse();
    test_filter_sql();
    test_sort_spec();
}

} // namespace filter_tests
