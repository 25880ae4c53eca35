#include <TesseraCore.hpp>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>

#include "BookModels.hpp"
#include "FilterTests.hpp"
#include "RegistryCodecTests.hpp"
#include "RepositoryTests.hpp"
#include "TransactionTests.hpp"

// ============================================================================
// Schema tests
// ============================================================================

void test_inferred_schema() {
    std::cout << "Testing inferred entity schema..." << std::endl;

    const auto& schema = tessera::schema_of<AudioBook>();
    assert(schema.fields().size() == 6);

    assert(schema.field("title")->type == tessera::field_type::string);
    assert(schema.field("title")->required);
    assert(schema.field("hosting_platforms")->type == tessera::field_type::array);
    assert(!schema.field("hosting_platforms")->required);
    assert(!schema.field("format")->required);
    assert(schema.field("is_deleted")->type == tessera::field_type::boolean);
    assert(!schema.has_field("id"));
    assert(!schema.field("isbn")->unique);

    const auto& paper = tessera::schema_of<PaperBook>();
    assert(paper.field("edition")->type == tessera::field_type::integer);

    assert(std::string(tessera::entity_traits<AudioBook>::name) == "AudioBook");

    // Unknown names are a setup error
    auto copy = tessera::schema_of<Book>();
    bool threw = false;
    try {
        copy.unique("subtitle");
    } catch (const tessera::configuration_error&) {
        threw = true;
    }
    assert(threw);

    // Rules can be tightened, relaxed and extended
    copy.optional("description").require("title").unique("isbn");
    assert(!copy.field("description")->required);
    assert(copy.field("isbn")->unique);
    copy.add(tessera::field_rule{"subtitle", tessera::field_type::string, false, false});
    assert(copy.has_field("subtitle"));
    threw = false;
    try {
        copy.add(tessera::field_rule{"title", tessera::field_type::string, true, false});
    } catch (const tessera::configuration_error&) {
        threw = true;
    }
    assert(threw);
    assert(!tessera::schema_of<Book>().has_field("subtitle"));

    std::cout << "  Inferred schema OK" << std::endl;
}

void test_schema_validation() {
    std::cout << "Testing schema validation..." << std::endl;

    auto schema = tessera::schema_of<PaperBook>();
    nlohmann::json doc = {{"title", "Emma"}, {"description", "Novel"}, {"isbn", "222"},
                          {"edition", 1}, {"is_deleted", false}, {"__t", "PaperBook"},
                          {"subtitle", "dropped"}};

    schema.strip_unknown(doc);
    assert(!doc.contains("subtitle"));
    assert(doc.contains("__t"));
    schema.validate(doc);

    // Missing, null and empty required values
    for (const auto& bad : {nlohmann::json(nullptr), nlohmann::json("")}) {
        auto copy = doc;
        copy["isbn"] = bad;
        bool threw = false;
        try {
            schema.validate(copy);
        } catch (const tessera::constraint_error& e) {
            threw = e.field() == "isbn";
        }
        assert(threw);
    }

    auto missing = doc;
    missing.erase("title");
    bool threw = false;
    try {
        schema.validate(missing);
    } catch (const tessera::constraint_error& e) {
        threw = e.field() == "title";
    }
    assert(threw);

    // Wrong type
    auto wrong = doc;
    wrong["edition"] = "first";
    threw = false;
    try {
        schema.validate(wrong);
    } catch (const tessera::constraint_error& e) {
        threw = e.field() == "edition";
    }
    assert(threw);

    std::cout << "  Schema validation OK" << std::endl;
}

void test_entity_documents() {
    std::cout << "Testing entity documents..." << std::endl;

    AuditablePaperBook book{std::string("id-1"), "Emma", "Novel", "222", 3, {}};
    book.audit.version = 2;
    book.audit.created_by = "alice";
    book.audit.created_at = tessera::detail::from_millis(1700000000000);

    auto doc = tessera::entity_traits<AuditablePaperBook>::to_document(book);
    assert(!doc.contains("id"));
    assert(doc["edition"] == 3);
    assert(doc["__v"] == 2);
    assert(doc["createdBy"] == "alice");
    assert(doc["createdAt"] == 1700000000000);
    assert(doc["updatedBy"].is_null());

    doc["id"] = "id-1";
    auto back = tessera::entity_traits<AuditablePaperBook>::from_document(doc);
    assert(back.id == book.id);
    assert(back.edition == 3);
    assert(back.audit == book.audit);

    // Sparse patches carry only what was supplied
    tessera::partial<AudioBook> patch;
    patch.title = "Ulysses";
    patch.format.emplace(std::nullopt);
    auto fields = patch.fields();
    assert(fields.size() == 2);
    assert(fields["title"] == "Ulysses");
    assert(fields["format"].is_null());
    assert(!fields.contains("isbn"));

    std::cout << "  Entity documents OK" << std::endl;
}

struct Counter {
    std::optional<std::string> id;
    std::string name;
    uint64_t hits = 0;
};
TESSERA_ENTITY(Counter, name, hits);

void test_unsigned_fields() {
    std::cout << "Testing unsigned fields..." << std::endl;

    const auto max_hits = std::numeric_limits<uint64_t>::max();
    auto value = tessera::detail::to_json_value(max_hits);
    assert(value.is_number_unsigned());
    assert(value.get<uint64_t>() == max_hits);
    assert(tessera::detail::to_json_value(int8_t{-1}) == -1);

    // SQLite integers are signed, so larger values bind as REAL
    auto param = tessera::detail::to_column_value(value);
    assert(std::holds_alternative<double>(param));
    assert(std::get<int64_t>(tessera::detail::to_column_value(nlohmann::json(uint64_t{42}))) == 42);

    using AnyCounter = std::variant<Counter>;
    tessera::repository<AnyCounter> counters({
        {tessera::supertype_key, tessera::type_entry<AnyCounter>::of<Counter>()},
    }, book_fixtures::on(book_fixtures::memory_connection()));
    auto saved = counters.save(Counter{std::nullopt, "visits", max_hits});
    auto found = counters.find_by_id(*std::get<Counter>(saved).id);
    assert(found.has_value());
    assert(std::get<Counter>(*found).hits == max_hits);

    std::cout << "  Unsigned fields OK" << std::endl;
}

int main() {
    std::cout << "=== TesseraCore Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        // Schema tests
        test_inferred_schema();
        test_schema_validation();
        test_entity_documents();
        test_unsigned_fields();

        // Query building
        filter_tests::run_all();

        // Type dispatch
        registry_codec_tests::run_all();

        // Repository operations
        repository_tests::run_all();

        // Transactions
        transaction_tests::run_all();

        std::cout << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "All tests passed!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
