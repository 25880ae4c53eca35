#pragma once

#include "BookModels.hpp"
#include <cassert>
#include <iostream>

namespace registry_codec_tests {

using namespace book_fixtures;
using entry = tessera::type_entry<AnyBook>;

// ============================================================================
// test_registry_resolution - supertype and subtypes resolve by name
// ============================================================================

void test_registry_resolution() {
    std::cout << "  test_registry_resolution..." << std::flush;

    tessera::type_registry<AnyBook> registry(book_types());

    assert(registry.supertype_name() == "Book");
    assert(registry.supertype_constructor());
    assert(registry.subtype_entries().size() == 2);

    assert(registry.contains("Book"));
    assert(registry.contains("PaperBook"));
    assert(registry.contains("AudioBook"));
    assert(!registry.contains("ElectronicBook"));
    assert(!registry.contains(tessera::supertype_key));

    auto* paper = registry.resolve("PaperBook");
    assert(paper != nullptr);
    assert(paper->name == "PaperBook");
    assert(paper->soft_deletable);
    assert(!paper->auditable);
    assert(paper->schema.field("isbn")->unique);
    assert(registry.resolve("Comic") == nullptr);

    tessera::type_registry<AnyAuditableBook> audited(auditable_book_types());
    assert(audited.supertype().auditable);
    assert(!audited.supertype().soft_deletable);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_registry_configuration_errors - invalid type maps fail at construction
// ============================================================================

void test_registry_configuration_errors() {
    std::cout << "  test_registry_configuration_errors..." << std::flush;

    // No supertype entry
    bool threw = false;
    try {
        tessera::type_registry<AnyBook> registry({{"PaperBook", entry::of<PaperBook>()}});
    } catch (const tessera::configuration_error& e) {
        threw = std::string(e.what()).find("supertype") != std::string::npos;
    }
    assert(threw);

    // Abstract supertype without a model name
    threw = false;
    try {
        tessera::type_registry<AnyBook> registry({
            {tessera::supertype_key, entry::abstract(tessera::schema_of<Book>())},
            {"PaperBook", entry::of<PaperBook>()},
        });
    } catch (const tessera::configuration_error&) {
        threw = true;
    }
    assert(threw);

    // The model name fills in the abstract supertype's name
    tessera::type_registry<AnyBook> named({
        {tessera::supertype_key, entry::abstract(tessera::schema_of<Book>())},
        {"PaperBook", entry::of<PaperBook>()},
    }, std::string("Book"));
    assert(named.supertype_name() == "Book");
    assert(!named.supertype_constructor());
    assert(named.contains("Book"));

    // Subtype key must be the type name
    threw = false;
    try {
        tessera::type_registry<AnyBook> registry({
            {tessera::supertype_key, entry::of<Book>()},
            {"Paper", entry::of<PaperBook>()},
        });
    } catch (const tessera::configuration_error&) {
        threw = true;
    }
    assert(threw);

    // Subtypes cannot be abstract
    threw = false;
    try {
        tessera::type_registry<AnyBook> registry({
            {tessera::supertype_key, entry::of<Book>()},
            {"PaperBook", entry::abstract(tessera::schema_of<PaperBook>(), "PaperBook")},
        });
    } catch (const tessera::configuration_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_codec_hydrate - discriminator selects the constructor
// ============================================================================

void test_codec_hydrate() {
    std::cout << "  test_codec_hydrate..." << std::flush;

    tessera::type_registry<AnyBook> registry(book_types());
    tessera::document_codec<AnyBook> codec(registry);

    // Null in, null out
    assert(!codec.hydrate(std::nullopt).has_value());

    // No discriminator: supertype
    tessera::stored_document plain;
    plain.id = "b-1";
    plain.body = {{"title", "Dune"}, {"description", "Sand"}, {"isbn", "111"}, {"is_deleted", false}};
    auto book = codec.hydrate(plain);
    assert(book.has_value());
    assert(std::holds_alternative<Book>(*book));
    assert(std::get<Book>(*book).id == std::string("b-1"));
    assert(std::get<Book>(*book).title == "Dune");

    // Subtype discriminator
    tessera::stored_document paper;
    paper.id = "p-1";
    paper.body = {{"__t", "PaperBook"}, {"title", "Emma"}, {"description", "Novel"},
                  {"isbn", "222"}, {"edition", 3}, {"is_deleted", false}};
    auto paper_book = codec.hydrate(paper);
    assert(std::holds_alternative<PaperBook>(*paper_book));
    assert(std::get<PaperBook>(*paper_book).edition == 3);

    // Unknown discriminator
    tessera::stored_document comic;
    comic.id = "c-1";
    comic.body = {{"__t", "Comic"}, {"title", "Asterix"}};
    bool threw = false;
    try {
        codec.hydrate(comic);
    } catch (const tessera::unregistered_constructor_error& e) {
        threw = std::string(e.what()).find("c-1") != std::string::npos && e.type_name() == "Comic";
    }
    assert(threw);

    // Stored body that does not fit the type
    tessera::stored_document broken;
    broken.id = "x-1";
    broken.body = {{"__t", "PaperBook"}, {"title", "Broken"}, {"edition", "third"}};
    threw = false;
    try {
        codec.hydrate(broken);
    } catch (const tessera::db_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_codec_abstract_supertype - documents without discriminator cannot hydrate
// ============================================================================

void test_codec_abstract_supertype() {
    std::cout << "  test_codec_abstract_supertype..." << std::flush;

    tessera::type_registry<AnyBook> registry({
        {tessera::supertype_key, entry::abstract(tessera::schema_of<Book>(), "Book")},
        {"PaperBook", entry::of<PaperBook>()},
    });
    tessera::document_codec<AnyBook> codec(registry);

    tessera::stored_document plain;
    plain.id = "b-2";
    plain.body = {{"title", "Dune"}};
    bool threw = false;
    try {
        codec.hydrate(plain);
    } catch (const tessera::unregistered_constructor_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_codec_dehydrate - subtypes carry their discriminator, round trip holds
// ============================================================================

void test_codec_dehydrate() {
    std::cout << "  test_codec_dehydrate..." << std::flush;

    tessera::type_registry<AnyBook> registry(book_types());
    tessera::document_codec<AnyBook> codec(registry);

    auto plain = codec.dehydrate(AnyBook(make_book("Dune", "111")));
    assert(plain.type_name == "Book");
    assert(!plain.body.contains("__t"));
    assert(!plain.body.contains("id"));

    AudioBook audio = make_audio_book("Emma", "333", {"Spotify", "Audible"});
    audio.id = "a-1";
    auto prepared = codec.dehydrate(AnyBook(audio));
    assert(prepared.type_name == "AudioBook");
    assert(prepared.body["__t"] == "AudioBook");
    assert(prepared.body["hosting_platforms"].size() == 2);

    tessera::stored_document stored;
    stored.id = "a-1";
    stored.body = prepared.body;
    auto back = codec.hydrate(stored);
    assert(std::holds_alternative<AudioBook>(*back));
    const auto& restored = std::get<AudioBook>(*back);
    assert(restored.id == audio.id);
    assert(restored.title == audio.title);
    assert(restored.hosting_platforms == audio.hosting_platforms);
    assert(restored.format == audio.format);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing type registry and document codec..." << std::endl;
    test_registry_resolution();
    test_registry_configuration_errors();
    test_codec_hydrate();
    test_codec_abstract_supertype();
    test_codec_dehydrate();
}

} // namespace registry_codec_tests
