#pragma once

#include "mh/model/PrototypeKey.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mh::history {

enum class Operation {
    Create,
    Overwrite,
    Modify
};

const char* ToString(Operation operation);

struct ModificationRecord {
    model::PrototypeKey key;
    std::string package;
    std::string sourceLocation;
    std::chrono::system_clock::time_point timestamp{};
    std::uint64_t sequence = 0;
    Operation operation = Operation::Create;
    std::string fieldPath;  // empty for whole-object create/overwrite
    nlohmann::json oldValue;
    nlohmann::json newValue;
};

/// Append-only ledger for one prototype. currentValue always mirrors the last record's newValue.
class PrototypeHistory {
public:
    explicit PrototypeHistory(model::PrototypeKey key);

    [[nodiscard]] const model::PrototypeKey& Key() const noexcept { return m_key; }
    [[nodiscard]] const std::vector<ModificationRecord>& Modifications() const noexcept { return m_modifications; }
    [[nodiscard]] const nlohmann::json& CurrentValue() const noexcept { return m_currentValue; }

    /// Distinct authoring packages in first-touch order.
    [[nodiscard]] std::vector<std::string> Packages() const;

private:
    friend class HistoryStore;
    void Append(ModificationRecord record);

    model::PrototypeKey m_key;
    std::vector<ModificationRecord> m_modifications;
    nlohmann::json m_currentValue;
};

struct ConflictEntry {
    model::PrototypeKey key;
    std::vector<std::string> packages;
};

struct HistorySummary {
    std::size_t totalPrototypes = 0;
    std::size_t totalModifications = 0;
    std::size_t totalConflicts = 0;
    std::map<std::string, std::size_t> modificationsByPackage;
    std::map<std::string, std::size_t> prototypesByKind;
};

/**
 * @brief Records every prototype mutation made while packages load.
 *
 * Writers open a package context with BeginContext() and pass the returned
 * handle to every Record* call. Calls made with an ended or unknown handle are
 * dropped with a warning. Only one context is active at a time; beginning a new
 * one ends the previous.
 */
class HistoryStore {
public:
    using ContextId = std::uint64_t;
    static constexpr ContextId kInvalidContext = 0;

    using HistoryMap = std::map<model::PrototypeKey, PrototypeHistory>;

    HistoryStore() = default;

    ContextId BeginContext(std::string package, std::string location);
    void EndContext(ContextId context);
    [[nodiscard]] bool IsActive(ContextId context) const noexcept;

    bool RecordAddition(ContextId context,
                        const std::string& kind,
                        const std::string& name,
                        const nlohmann::json& value);

    bool RecordModification(ContextId context,
                            const std::string& kind,
                            const std::string& name,
                            const std::string& fieldPath,
                            const nlohmann::json& oldValue,
                            const nlohmann::json& newValue);

    [[nodiscard]] std::vector<ConflictEntry> Conflicts() const;
    [[nodiscard]] const PrototypeHistory* HistoryFor(const std::string& kind, const std::string& name) const;
    [[nodiscard]] const PrototypeHistory* HistoryFor(const model::PrototypeKey& key) const;
    [[nodiscard]] bool Contains(const model::PrototypeKey& key) const;
    [[nodiscard]] std::vector<ModificationRecord> ModificationsBy(std::string_view package) const;
    [[nodiscard]] std::vector<std::string> ModificationChain(const std::string& kind, const std::string& name) const;
    [[nodiscard]] std::vector<std::string> Packages() const;
    [[nodiscard]] HistorySummary Summary() const;
    [[nodiscard]] const HistoryMap& Histories() const noexcept { return m_histories; }

    [[nodiscard]] nlohmann::json ExportHistory() const;

    void Reset();

private:
    struct ActiveContext {
        ContextId id = kInvalidContext;
        std::string package;
        std::string location;
    };

    const ActiveContext* ResolveContext(ContextId context, std::string_view operation,
                                        const std::string& kind, const std::string& name) const;
    PrototypeHistory& EnsureHistory(const std::string& kind, const std::string& name);
    ModificationRecord MakeRecord(const ActiveContext& context,
                                  const std::string& kind,
                                  const std::string& name,
                                  Operation operation);

    HistoryMap m_histories;
    std::optional<ActiveContext> m_active;
    ContextId m_nextContextId = 1;
    std::uint64_t m_nextSequence = 1;
};

/// Begins a package context for its lifetime.
class PackageScope {
public:
    PackageScope(HistoryStore& store, std::string package, std::string location);
    ~PackageScope();

    PackageScope(const PackageScope&) = delete;
    PackageScope& operator=(const PackageScope&) = delete;

    bool Add(const std::string& kind, const std::string& name, const nlohmann::json& value);
    bool Modify(const std::string& kind,
                const std::string& name,
                const std::string& fieldPath,
                const nlohmann::json& oldValue,
                const nlohmann::json& newValue);

    [[nodiscard]] HistoryStore::ContextId Id() const noexcept { return m_context; }

private:
    HistoryStore& m_store;
    HistoryStore::ContextId m_context = HistoryStore::kInvalidContext;
};

std::string FormatTimestamp(std::chrono::system_clock::time_point time);

} // namespace mh::history
