#include "json_document.hpp"

#include <google/protobuf/util/json_util.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "internal/util/errors.hpp"

namespace castproxy::store::file {

std::string ReadDocument(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::StoreUnavailable("cannot open " + path);
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    throw util::StoreUnavailable("read error on " + path);
  }
  return buffer.str();
}

void ParseWrapped(const std::string& path, const std::string& field, const std::string& document, google::protobuf::Message* message) {
  const std::string wrapped = "{\"" + field + "\":" + document + "}";

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(wrapped, message, options);
  if (!status.ok()) {
    throw util::StoreUnavailable("malformed " + path + ": " + std::string(status.message()));
  }
}

void WriteDocument(const std::string& path, const std::string& document) {
  const std::filesystem::path target(path);
  if (target.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
      throw util::StoreUnavailable("cannot create directory for " + path + ": " + ec.message());
    }
  }

  const std::string tmp_path = path + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw util::StoreUnavailable("cannot write " + tmp_path);
    }
    out << document;
    out.flush();
    if (!out) {
      throw util::StoreUnavailable("short write on " + tmp_path);
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, target, ec);
  if (ec) {
    std::remove(tmp_path.c_str());
    throw util::StoreUnavailable("cannot replace " + path + ": " + ec.message());
  }
}

} // namespace castproxy::store::file
