#pragma once

#include "types.hpp"
#include "did.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace aeon
{

    /**
     * Abstract interface for identity document storage backends.
     * Signing and verification never touch a store.
     */
    class DidStore
    {
    public:
        virtual ~DidStore() = default;

        /** Persist a document, replacing any document with the same name. */
        virtual Result<void> save(const IdentityDocument &document) = 0;

        /** Load by name; std::nullopt when absent. */
        virtual Result<std::optional<IdentityDocument>> load(const std::string &name) = 0;

        /** All readable documents, sorted by name. Unreadable entries are skipped. */
        virtual std::vector<IdentityDocument> list() = 0;

        /** Returns false when no document by that name existed. */
        virtual Result<bool> remove(const std::string &name) = 0;
    };

    /**
     * One JSON file per document: <directory>/<name>.json, owner read/write only.
     */
    class FileDidStore : public DidStore
    {
    public:
        explicit FileDidStore(std::filesystem::path directory);

        /** $HOME/.aeon/dids (falls back to ./.aeon/dids without HOME) */
        static std::filesystem::path default_directory();

        Result<void> save(const IdentityDocument &document) override;
        Result<std::optional<IdentityDocument>> load(const std::string &name) override;
        std::vector<IdentityDocument> list() override;
        Result<bool> remove(const std::string &name) override;

        const std::filesystem::path &directory() const { return directory_; }

    private:
        Result<std::filesystem::path> path_for(const std::string &name) const;

        std::filesystem::path directory_;
    };

} // namespace aeon
