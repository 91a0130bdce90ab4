#pragma once

#include <optional>
#include <string>

#include "sweep/result_set.hpp"
#include "sweep/sweep_identity.hpp"

namespace sweep {

/**
 * @brief Durable cache of result sets keyed by sweep identity.
 */
struct IResultStore {
    virtual ~IResultStore() = default;

    /**
     * @return The stored result set for this identity, or std::nullopt.
     * @throws PersistenceError if a stored entry exists but cannot be read.
     */
    [[nodiscard]] virtual std::optional<ResultSet> load(const SweepIdentity& identity) = 0;

    /**
     * @brief Store atomically: readers see the old entry or the new one, never a mix.
     * @throws PersistenceError on failure; the previous entry is left intact.
     */
    virtual void save(const SweepIdentity& identity, const ResultSet& results) = 0;
};

/**
 * @brief Replace a file so that a crash at any point leaves either the old
 *        contents or the new ones.
 *
 * Writes a temporary file beside the target, fsyncs it, renames it over the
 * target and fsyncs the directory.
 *
 * @throws PersistenceError on failure; the temporary file is removed.
 */
void writeFileAtomically(const std::string& path, const std::string& contents);

/**
 * @brief One JSON file per sweep, "<directory>/<strategy>-<digest>.json".
 */
class FileResultStore: public IResultStore {
   public:
    /**
     * @param directory Created on first save if missing.
     */
    explicit FileResultStore(std::string directory);

    [[nodiscard]] std::optional<ResultSet> load(const SweepIdentity& identity) override;

    void save(const SweepIdentity& identity, const ResultSet& results) override;

    [[nodiscard]] std::string pathFor(const SweepIdentity& identity) const;

   private:
    std::string directory_;
};

}  // namespace sweep
