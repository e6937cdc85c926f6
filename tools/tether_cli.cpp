#include <tether/config.hpp>
#include <tether/rocks_store.hpp>
#include <tether/wire.hpp>

#include <iostream>
#include <stdexcept>
#include <string>

#include <trantor/utils/Logger.h>

static void usage(const char* argv0) {
  std::cerr
      << "usage:\n"
      << "  " << argv0 << " [options] put <type> <json-fields> [identity]\n"
      << "  " << argv0 << " [options] get <identity>\n"
      << "  " << argv0 << " [options] del <identity>\n"
      << "  " << argv0 << " [options] query <type> [limit]\n"
      << "  " << argv0 << " [options] count <type>\n"
      << "  (see --help for options)\n";
}

// Fields are given in wire form, e.g. {"name":"Ada","pet":{"identity":"..."}}.
static bool ParseFields(const std::string& text, tether::Record* record, std::string* error) {
  Json::Value json;
  if (!tether::ParseJson(text, &json, error)) return false;
  if (!json.isObject()) {
    *error = "fields must be a JSON object";
    return false;
  }
  for (const auto& name : json.getMemberNames()) {
    if (tether::IsSystemFieldName(name)) {
      *error = "'" + name + "' is a reserved attribute";
      return false;
    }
    tether::AttributeValue value;
    if (!tether::AttributeFromJson(json[name], &value)) {
      *error = "field '" + name + "' is not a valid attribute value";
      return false;
    }
    record->Set(name, std::move(value));
  }
  return true;
}

int main(int argc, char** argv) {
  tether::Config config;
  try {
    config = tether::Config::LoadFromArgs(argc, argv);
    config.Validate();
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    usage(argv[0]);
    return 2;
  }

  const auto& args = config.args;
  if (args.empty()) { usage(argv[0]); return 2; }
  const std::string& cmd = args[0];

  if (config.logging.level == "trace") {
    trantor::Logger::setLogLevel(trantor::Logger::kTrace);
  } else if (config.logging.level == "debug") {
    trantor::Logger::setLogLevel(trantor::Logger::kDebug);
  } else if (config.logging.level == "info") {
    trantor::Logger::setLogLevel(trantor::Logger::kInfo);
  } else if (config.logging.level == "error") {
    trantor::Logger::setLogLevel(trantor::Logger::kError);
  } else {
    trantor::Logger::setLogLevel(trantor::Logger::kWarn);
  }

  std::unique_ptr<tether::RocksRecordStore> db;
  auto s = tether::RocksRecordStore::Open(config.store.path, &db, config.ToStoreOptions());
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  if (cmd == "put") {
    if (args.size() != 3 && args.size() != 4) { usage(argv[0]); return 2; }
    tether::Record record;
    record.record_type = args[1];
    if (args.size() == 4) record.identity = args[3];
    std::string error;
    if (!ParseFields(args[2], &record, &error)) {
      std::cerr << "Invalid fields: " << error << "\n";
      return 2;
    }
    tether::Record saved;
    s = db->Save(record, &saved);
    if (!s.ok()) {
      std::cerr << "Save failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << saved.identity << "\n";
    return 0;
  } else if (cmd == "get") {
    if (args.size() != 2) { usage(argv[0]); return 2; }
    tether::Record record;
    s = db->Fetch(args[1], &record);
    if (!s.ok()) {
      std::cerr << "Fetch failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << tether::SerializeRecord(record) << "\n";
    return 0;
  } else if (cmd == "del") {
    if (args.size() != 2) { usage(argv[0]); return 2; }
    s = db->Delete(args[1]);
    if (!s.ok() && !s.IsNotFound()) {
      std::cerr << "Delete failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "OK\n";
    return 0;
  } else if (cmd == "query") {
    if (args.size() != 2 && args.size() != 3) { usage(argv[0]); return 2; }
    tether::QuerySpec spec;
    spec.record_type = args[1];
    if (args.size() == 3) {
      try {
        spec.limit = std::stoull(args[2]);
      } catch (const std::logic_error&) {
        std::cerr << "Invalid limit: " << args[2] << "\n";
        return 2;
      }
    }
    tether::QueryPage page;
    s = db->Query(spec, std::nullopt, &page);
    if (!s.ok()) {
      std::cerr << "Query failed: " << s.ToString() << "\n";
      return 1;
    }
    for (const auto& m : page.matches) {
      if (m.status.ok()) {
        std::cout << tether::SerializeRecord(m.record) << "\n";
      } else {
        std::cerr << m.identity << ": " << m.status.ToString() << "\n";
      }
    }
    if (page.next_cursor) std::cerr << "(more)\n";
    return 0;
  } else if (cmd == "count") {
    if (args.size() != 2) { usage(argv[0]); return 2; }
    uint64_t n = 0;
    s = db->Count(args[1], &n);
    if (!s.ok()) {
      std::cerr << "Count failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << args[1] << "=" << n << "\n";
    return 0;
  }

  usage(argv[0]);
  return 2;
}
