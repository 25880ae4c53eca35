#pragma once

// TesseraCore - polymorphic document repositories on SQLite
//
// Usage:
//   #include <TesseraCore.hpp>
//
//   struct Book {
//       std::optional<std::string> id;
//       std::string title;
//       std::string isbn;
//   };
//   TESSERA_ENTITY(Book, title, isbn);
//
//   struct PaperBook {
//       std::optional<std::string> id;
//       std::string title;
//       std::string isbn;
//       int edition = 0;
//   };
//   TESSERA_ENTITY(PaperBook, title, isbn, edition);
//
//   int main() {
//       tessera::connect();   // in-memory, or tessera::configuration("books.db")
//
//       using AnyBook = std::variant<Book, PaperBook>;
//       tessera::transactional_repository<AnyBook> books({
//           {tessera::supertype_key, tessera::type_entry<AnyBook>::of<Book>()},
//           {"PaperBook", tessera::type_entry<AnyBook>::of<PaperBook>()},
//       });
//
//       auto saved = books.save(PaperBook{std::nullopt, "Effective C++", "0321334876", 3});
//       auto found = books.find_by_id(*std::get<PaperBook>(saved).id);
//   }

#include "tessera/types.hpp"
#include "tessera/log.hpp"
#include "tessera/errors.hpp"
#include "tessera/db.hpp"
#include "tessera/connection.hpp"
#include "tessera/schema.hpp"
#include "tessera/filter.hpp"
#include "tessera/collection.hpp"
#include "tessera/type_registry.hpp"
#include "tessera/document_codec.hpp"
#include "tessera/options.hpp"
#include "tessera/transaction.hpp"
#include "tessera/repository.hpp"
#include "tessera/transactional_repository.hpp"
