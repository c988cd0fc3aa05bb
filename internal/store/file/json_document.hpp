#pragma once

#include <string>

#include <google/protobuf/message.h>

namespace castproxy::store::file {

/*
  Helpers for the JSON documents shared with the pairing API and the
  discovery subsystem. Those documents are a bare JSON object / array;
  they are wrapped under `field` so they can be parsed into a message.
*/

// Reads the whole file. Throws util::StoreUnavailable if it cannot be opened.
std::string ReadDocument(const std::string& path);

// Parses `{"<field>": <document>}` into `message`, ignoring unknown keys.
// Throws util::StoreUnavailable on malformed input.
void ParseWrapped(const std::string& path, const std::string& field, const std::string& document, google::protobuf::Message* message);

// Replaces the file atomically (write to a sibling temp file, then rename).
void WriteDocument(const std::string& path, const std::string& document);

} // namespace castproxy::store::file
