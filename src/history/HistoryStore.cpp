#include "mh/history/HistoryStore.hpp"

#include "mh/core/Logger.hpp"

#include <algorithm>
#include <ctime>
#include <utility>

#include <fmt/format.h>

namespace mh::history {

namespace {

void AddUnique(std::vector<std::string>& values, const std::string& value) {
    if (std::find(values.begin(), values.end(), value) == values.end()) {
        values.push_back(value);
    }
}

} // namespace

const char* ToString(Operation operation) {
    switch (operation) {
        case Operation::Create:    return "create";
        case Operation::Overwrite: return "overwrite";
        case Operation::Modify:    return "modify";
    }
    return "modify";
}

std::string FormatTimestamp(std::chrono::system_clock::time_point time) {
    using namespace std::chrono;
    const auto timeT = system_clock::to_time_t(time);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &timeT);
#else
    localtime_r(&timeT, &tm);
#endif
    const auto ms = duration_cast<milliseconds>(time.time_since_epoch()) % 1000;
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}",
                       tm.tm_year + 1900,
                       tm.tm_mon + 1,
                       tm.tm_mday,
                       tm.tm_hour,
                       tm.tm_min,
                       tm.tm_sec,
                       ms.count());
}

PrototypeHistory::PrototypeHistory(model::PrototypeKey key)
    : m_key(std::move(key)) {}

std::vector<std::string> PrototypeHistory::Packages() const {
    std::vector<std::string> packages;
    for (const auto& record : m_modifications) {
        AddUnique(packages, record.package);
    }
    return packages;
}

void PrototypeHistory::Append(ModificationRecord record) {
    m_currentValue = record.newValue;
    m_modifications.push_back(std::move(record));
}

HistoryStore::ContextId HistoryStore::BeginContext(std::string package, std::string location) {
    if (m_active) {
        core::Logger::Debug("[HistoryStore] Context for '{}' replaced by '{}'", m_active->package, package);
    }
    ActiveContext context;
    context.id = m_nextContextId++;
    context.package = std::move(package);
    context.location = std::move(location);
    core::Logger::Debug("[HistoryStore] Set package context: {} - {}", context.package, context.location);
    m_active = std::move(context);
    return m_active->id;
}

void HistoryStore::EndContext(ContextId context) {
    if (m_active && m_active->id == context) {
        m_active.reset();
    }
}

bool HistoryStore::IsActive(ContextId context) const noexcept {
    return context != kInvalidContext && m_active && m_active->id == context;
}

const HistoryStore::ActiveContext* HistoryStore::ResolveContext(ContextId context,
                                                                std::string_view operation,
                                                                const std::string& kind,
                                                                const std::string& name) const {
    if (!IsActive(context)) {
        core::Logger::Warning("[HistoryStore] No package context set for prototype {}: {}",
                              operation, model::FormatKey(kind, name));
        return nullptr;
    }
    return &*m_active;
}

PrototypeHistory& HistoryStore::EnsureHistory(const std::string& kind, const std::string& name) {
    model::PrototypeKey key(kind, name);
    auto [it, inserted] = m_histories.try_emplace(key, key);
    (void)inserted;
    return it->second;
}

ModificationRecord HistoryStore::MakeRecord(const ActiveContext& context,
                                            const std::string& kind,
                                            const std::string& name,
                                            Operation operation) {
    ModificationRecord record;
    record.key = model::PrototypeKey(kind, name);
    record.package = context.package;
    record.sourceLocation = context.location;
    record.timestamp = std::chrono::system_clock::now();
    record.sequence = m_nextSequence++;
    record.operation = operation;
    return record;
}

bool HistoryStore::RecordAddition(ContextId context,
                                  const std::string& kind,
                                  const std::string& name,
                                  const nlohmann::json& value) {
    const ActiveContext* active = ResolveContext(context, "addition", kind, name);
    if (!active) {
        return false;
    }
    if (kind.empty() || name.empty()) {
        core::Logger::Warning("[HistoryStore] Ignoring addition with empty kind or name from '{}'", active->package);
        return false;
    }
    if (!value.is_object()) {
        core::Logger::Warning("[HistoryStore] Skipping {} from '{}': expected a structured prototype, got {}",
                              model::FormatKey(kind, name), active->package, value.type_name());
        return false;
    }

    const PrototypeHistory* existing = HistoryFor(kind, name);
    const Operation operation = existing ? Operation::Overwrite : Operation::Create;

    ModificationRecord record = MakeRecord(*active, kind, name, operation);
    if (existing) {
        record.oldValue = existing->CurrentValue();
        core::Logger::Info("[HistoryStore] Prototype {} being overwritten by {}",
                           model::FormatKey(kind, name), active->package);
    } else {
        core::Logger::Debug("[HistoryStore] New prototype {} created by {}",
                            model::FormatKey(kind, name), active->package);
    }
    record.newValue = value;

    EnsureHistory(kind, name).Append(std::move(record));
    return true;
}

bool HistoryStore::RecordModification(ContextId context,
                                      const std::string& kind,
                                      const std::string& name,
                                      const std::string& fieldPath,
                                      const nlohmann::json& oldValue,
                                      const nlohmann::json& newValue) {
    const ActiveContext* active = ResolveContext(context, "modification", kind, name);
    if (!active) {
        return false;
    }
    if (kind.empty() || name.empty()) {
        core::Logger::Warning("[HistoryStore] Ignoring modification with empty kind or name from '{}'",
                              active->package);
        return false;
    }

    ModificationRecord record = MakeRecord(*active, kind, name, Operation::Modify);
    record.fieldPath = fieldPath;
    record.oldValue = oldValue;
    record.newValue = newValue;

    EnsureHistory(kind, name).Append(std::move(record));
    core::Logger::Debug("[HistoryStore] Tracked modification: {}.{} by {}",
                        model::FormatKey(kind, name), fieldPath, active->package);
    return true;
}

std::vector<ConflictEntry> HistoryStore::Conflicts() const {
    std::vector<ConflictEntry> conflicts;
    for (const auto& [key, history] : m_histories) {
        auto packages = history.Packages();
        if (packages.size() > 1) {
            conflicts.push_back(ConflictEntry{key, std::move(packages)});
        }
    }
    return conflicts;
}

const PrototypeHistory* HistoryStore::HistoryFor(const std::string& kind, const std::string& name) const {
    return HistoryFor(model::PrototypeKey(kind, name));
}

const PrototypeHistory* HistoryStore::HistoryFor(const model::PrototypeKey& key) const {
    auto it = m_histories.find(key);
    if (it == m_histories.end()) {
        return nullptr;
    }
    return &it->second;
}

bool HistoryStore::Contains(const model::PrototypeKey& key) const {
    return m_histories.find(key) != m_histories.end();
}

std::vector<ModificationRecord> HistoryStore::ModificationsBy(std::string_view package) const {
    std::vector<ModificationRecord> records;
    for (const auto& [_, history] : m_histories) {
        for (const auto& record : history.Modifications()) {
            if (record.package == package) {
                records.push_back(record);
            }
        }
    }
    std::sort(records.begin(), records.end(), [](const ModificationRecord& lhs, const ModificationRecord& rhs) {
        return lhs.sequence < rhs.sequence;
    });
    return records;
}

std::vector<std::string> HistoryStore::ModificationChain(const std::string& kind, const std::string& name) const {
    const PrototypeHistory* history = HistoryFor(kind, name);
    if (!history) {
        return {};
    }
    return history->Packages();
}

std::vector<std::string> HistoryStore::Packages() const {
    std::vector<const ModificationRecord*> records;
    for (const auto& [_, history] : m_histories) {
        for (const auto& record : history.Modifications()) {
            records.push_back(&record);
        }
    }
    std::sort(records.begin(), records.end(), [](const ModificationRecord* lhs, const ModificationRecord* rhs) {
        return lhs->sequence < rhs->sequence;
    });
    std::vector<std::string> packages;
    for (const auto* record : records) {
        AddUnique(packages, record->package);
    }
    return packages;
}

HistorySummary HistoryStore::Summary() const {
    HistorySummary summary;
    summary.totalPrototypes = m_histories.size();
    for (const auto& [key, history] : m_histories) {
        ++summary.prototypesByKind[key.kind];
        summary.totalModifications += history.Modifications().size();
        for (const auto& record : history.Modifications()) {
            ++summary.modificationsByPackage[record.package];
        }
        if (history.Packages().size() > 1) {
            ++summary.totalConflicts;
        }
    }
    return summary;
}

nlohmann::json HistoryStore::ExportHistory() const {
    nlohmann::json exported;
    exported["metadata"] = {
        {"export_timestamp", FormatTimestamp(std::chrono::system_clock::now())},
        {"total_prototypes", m_histories.size()}
    };

    nlohmann::json prototypes = nlohmann::json::object();
    for (const auto& [key, history] : m_histories) {
        nlohmann::json modifications = nlohmann::json::array();
        for (const auto& record : history.Modifications()) {
            modifications.push_back({
                {"package", record.package},
                {"source_location", record.sourceLocation},
                {"sequence", record.sequence},
                {"timestamp", FormatTimestamp(record.timestamp)},
                {"operation", ToString(record.operation)},
                {"field_path", record.fieldPath},
                {"old_value", record.oldValue},
                {"new_value", record.newValue}
            });
        }
        prototypes[key.ToString()] = {
            {"kind", key.kind},
            {"name", key.name},
            {"modifications", std::move(modifications)}
        };
    }
    exported["prototypes"] = std::move(prototypes);
    return exported;
}

void HistoryStore::Reset() {
    m_histories.clear();
    m_active.reset();
    m_nextSequence = 1;
}

PackageScope::PackageScope(HistoryStore& store, std::string package, std::string location)
    : m_store(store),
      m_context(store.BeginContext(std::move(package), std::move(location))) {}

PackageScope::~PackageScope() {
    m_store.EndContext(m_context);
}

bool PackageScope::Add(const std::string& kind, const std::string& name, const nlohmann::json& value) {
    return m_store.RecordAddition(m_context, kind, name, value);
}

bool PackageScope::Modify(const std::string& kind,
                          const std::string& name,
                          const std::string& fieldPath,
                          const nlohmann::json& oldValue,
                          const nlohmann::json& newValue) {
    return m_store.RecordModification(m_context, kind, name, fieldPath, oldValue, newValue);
}

} // namespace mh::history
