#include <nlohmann/json.hpp>
#include <oirun/call_in_destructor.hh>
#include <oirun/file_manip.hh>
#include <oirun/json_str.hh>
#include <oirun/logger.hh>
#include <oirun/macros/stack_unwinding.hh>
#include <oirun/macros/throw.hh>
#include <oirun/errmsg.hh>
#include <oirun/registry/detection_cache.hh>
#include <oirun/time.hh>

using std::optional;
using std::string;

namespace {

using oirun::registry::CompilerDescriptor;

void append_compiler(json_str::ObjectBuilder& obj, const CompilerDescriptor& desc) {
    obj.prop("path", desc.path);
    obj.prop("kind", oirun::registry::to_str(desc.kind));
    obj.prop("version", desc.version);
    obj.prop("supportedStandards", desc.supported_standards);
    obj.prop("is64Bit", desc.is_64bit);
    obj.prop("priority", desc.priority_score);
}

CompilerDescriptor parse_compiler(const nlohmann::json& j) {
    CompilerDescriptor desc;
    desc.path = j.at("path").get<string>();
    auto kind = oirun::registry::kind_from_str(j.at("kind").get<string>());
    if (not kind) {
        throw std::invalid_argument("unknown compiler kind");
    }
    desc.kind = *kind;
    desc.version = j.at("version").get<string>();
    desc.supported_standards = j.at("supportedStandards").get<std::vector<string>>();
    desc.is_64bit = j.at("is64Bit").get<bool>();
    desc.priority_score = j.at("priority").get<int>();
    return desc;
}

} // namespace

namespace oirun::registry {

string serialize_detection_result(const DetectionResult& res) {
    json_str::Object obj;
    obj.prop("version", res.cache_version);
    obj.prop("timestamp", utc_iso8601(res.cache_timestamp));
    obj.prop("success", res.success);
    obj.prop_arr("compilers", [&](auto& arr) {
        for (const auto& desc : res.compilers) {
            arr.val_obj([&](auto& c) { append_compiler(c, desc); });
        }
    });
    if (res.recommended) {
        obj.prop_obj("recommended", [&](auto& c) { append_compiler(c, *res.recommended); });
    } else {
        obj.prop("recommended", nullptr);
    }
    obj.prop("suggestions", res.suggestions);
    obj.prop("errors", res.errors);
    return std::move(obj).into_str();
}

optional<DetectionResult> parse_detection_result(std::string_view json) {
    auto j = nlohmann::json::parse(json, nullptr, false);
    if (j.is_discarded() or not j.is_object()) {
        return std::nullopt;
    }

    try {
        DetectionResult res;
        res.cache_version = j.at("version").get<string>();
        auto timestamp = parse_utc_iso8601(j.at("timestamp").get<string>());
        if (not timestamp) {
            return std::nullopt;
        }
        res.cache_timestamp = *timestamp;
        res.success = j.at("success").get<bool>();
        for (const auto& c : j.at("compilers")) {
            res.compilers.emplace_back(parse_compiler(c));
        }
        if (const auto& rec = j.at("recommended"); not rec.is_null()) {
            res.recommended = parse_compiler(rec);
        }
        res.suggestions = j.at("suggestions").get<std::vector<string>>();
        res.errors = j.at("errors").get<std::vector<string>>();
        return res;
    } catch (const nlohmann::json::exception& e) {
        debuglog("registry: malformed cache record: ", e.what());
    } catch (const std::invalid_argument& e) {
        debuglog("registry: malformed cache record: ", e.what());
    }
    return std::nullopt;
}

optional<DetectionResult> MemoryCacheStore::load() {
    std::lock_guard lock{mutex_};
    if (not record_) {
        return std::nullopt;
    }
    return parse_detection_result(*record_);
}

void MemoryCacheStore::store(const DetectionResult& res) {
    auto record = serialize_detection_result(res);
    std::lock_guard lock{mutex_};
    record_ = std::move(record);
}

void MemoryCacheStore::clear() {
    std::lock_guard lock{mutex_};
    record_.reset();
}

SqliteCacheStore::SqliteCacheStore(const string& db_path) {
    STACK_UNWINDING_MARK;

    if (auto dir = path_dirpath(db_path); not dir.empty() and mkdir_r(string{dir}, 0700)) {
        THROW("mkdir_r(", dir, ')', errmsg());
    }
    db_ = SQLite::Connection(
        db_path, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX
    );
    db_.busy_timeout(5000);
    db_.execute("CREATE TABLE IF NOT EXISTS kv (key TEXT PRIMARY KEY, value TEXT NOT NULL)");
}

optional<DetectionResult> SqliteCacheStore::load() {
    STACK_UNWINDING_MARK;

    std::lock_guard lock{mutex_};
    string record;
    try {
        auto stmt = db_.prepare("SELECT value FROM kv WHERE key=?");
        stmt.bind_text(1, cache_key);
        if (stmt.step() != SQLITE_ROW) {
            debuglog("registry: no persisted cache record");
            return std::nullopt;
        }
        record = stmt.get_str(0);
    } catch (const std::runtime_error& e) {
        debuglog("registry: cannot read persisted cache: ", e.what());
        return std::nullopt;
    }
    return parse_detection_result(record);
}

void SqliteCacheStore::store(const DetectionResult& res) {
    STACK_UNWINDING_MARK;

    auto record = serialize_detection_result(res);
    std::lock_guard lock{mutex_};
    db_.execute("BEGIN IMMEDIATE");
    CallInDtor rollback{[&] { db_.execute("ROLLBACK"); }};

    auto stmt = db_.prepare("INSERT OR REPLACE INTO kv (key, value) VALUES(?, ?)");
    stmt.bind_text(1, cache_key);
    stmt.bind_text(2, record);
    stmt.step();

    rollback.cancel();
    db_.execute("COMMIT");
}

void SqliteCacheStore::clear() {
    STACK_UNWINDING_MARK;

    std::lock_guard lock{mutex_};
    auto stmt = db_.prepare("DELETE FROM kv WHERE key=?");
    stmt.bind_text(1, cache_key);
    stmt.step();
}

} // namespace oirun::registry
