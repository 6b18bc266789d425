#pragma once

// =============================================================================
// Tabular - typed records to and from CSV rows
// =============================================================================
//
// Records declare their fields with ADL fields() functions; nested records
// flatten into consecutive cells on encode and are addressed by dotted header
// paths on decode.
//
// Basic usage:
//
//   #include "tabular/tabular.hpp"
//
//   struct address_t {
//       std::string city;
//       int zip = 0;
//   };
//   auto fields(const address_t& a) {
//       return std::make_tuple(tabular::field("City", a.city), tabular::field("Zip", a.zip));
//   }
//   auto fields(address_t& a) {
//       return std::make_tuple(tabular::field("City", a.city), tabular::field("Zip", a.zip));
//   }
//
//   struct person_t {
//       std::string name;
//       std::unique_ptr<address_t> address;
//   };
//   auto fields(const person_t& p) {
//       return std::make_tuple(tabular::field("Name", p.name), tabular::field("Address", p.address));
//   }
//   auto fields(person_t& p) {
//       return std::make_tuple(tabular::field("Name", p.name), tabular::field("Address", p.address));
//   }
//
//   // Write: name,address.city,address.zip
//   std::ofstream out("people.csv");
//   tabular::csv_writer writer(out);
//   tabular::encoder enc(writer);
//   enc.write_header<person_t>();
//   enc.encode(person);                      // henry,NULL,NULL when address is empty
//
//   // Read
//   std::ifstream in("people.csv");
//   tabular::csv_reader reader(in);
//   tabular::decoder dec(reader);
//   for (person_t p; dec.decode(p); p = person_t{}) { ... }
//
// =============================================================================

#include "error.hpp"
#include "kinds.hpp"
#include "hooks.hpp"
#include "fields.hpp"
#include "options.hpp"
#include "scalar.hpp"
#include "path_tree.hpp"
#include "header.hpp"
#include "encode.hpp"
#include "decode.hpp"
#include "csv_options.hpp"
#include "csv_reader.hpp"
#include "csv_writer.hpp"
