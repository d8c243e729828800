#include "aeon/did_store.hpp"
#include "aeon/log.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <format>
#include <fstream>

namespace aeon
{

    FileDidStore::FileDidStore(std::filesystem::path directory)
        : directory_(std::move(directory))
    {
    }

    std::filesystem::path FileDidStore::default_directory()
    {
        const char *home = std::getenv("HOME");
        std::filesystem::path base = home ? std::filesystem::path(home) : std::filesystem::current_path();
        return base / ".aeon" / "dids";
    }

    Result<std::filesystem::path> FileDidStore::path_for(const std::string &name) const
    {
        // the name becomes a file name; keep it to [a-z0-9-]
        if (!is_valid_did_name(name))
            return std::unexpected(AeonError::invalid_name("Invalid DID name: " + name));
        return directory_ / (name + ".json");
    }

    Result<void> FileDidStore::save(const IdentityDocument &document)
    {
        auto path = path_for(document.name());
        if (!path)
            return std::unexpected(path.error());

        std::error_code ec;
        std::filesystem::create_directories(directory_, ec);
        if (ec)
        {
            return std::unexpected(AeonError::io(
                std::format("Failed to create DID directory {}: {}", directory_.string(), ec.message())));
        }

        // the key is only ever written into a file that is already owner-only;
        // the finished document then replaces the old one in a single rename
        std::filesystem::path staging = *path;
        staging += ".tmp";
        auto discard = [&staging]
        {
            std::error_code ignored;
            std::filesystem::remove(staging, ignored);
        };

        {
            std::ofstream create(staging, std::ios::out | std::ios::trunc);
            if (!create)
            {
                return std::unexpected(AeonError::io(
                    std::format("Failed to create DID file: {}", staging.string())));
            }
        }

        std::filesystem::permissions(staging,
                                     std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace, ec);
        if (ec)
        {
            discard();
            return std::unexpected(AeonError::storage(
                std::format("Failed to restrict permissions on {}: {}", staging.string(), ec.message())));
        }

        {
            std::ofstream file(staging, std::ios::out | std::ios::trunc);
            file << document.to_json(true).dump(2);
            file.close();
            if (!file)
            {
                discard();
                return std::unexpected(AeonError::io(
                    std::format("Failed to write DID file: {}", staging.string())));
            }
        }

        std::filesystem::rename(staging, *path, ec);
        if (ec)
        {
            discard();
            return std::unexpected(AeonError::io(
                std::format("Failed to move {} into place: {}", path->string(), ec.message())));
        }

        log::logger()->info("saved {} to {}", document.did(), path->string());
        return {};
    }

    Result<std::optional<IdentityDocument>> FileDidStore::load(const std::string &name)
    {
        auto path = path_for(name);
        if (!path)
            return std::unexpected(path.error());

        std::ifstream file(*path);
        if (!file)
            return std::optional<IdentityDocument>{};

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(AeonError::parsing(
                std::format("Invalid JSON in DID file {}: {}", path->string(), e.what())));
        }

        auto doc = IdentityDocument::from_json(j);
        if (!doc)
            return std::unexpected(doc.error());
        if (doc->name() != name)
        {
            return std::unexpected(AeonError::storage(
                std::format("DID file {} holds document for '{}'", path->string(), doc->name())));
        }
        return std::optional<IdentityDocument>(std::move(*doc));
    }

    std::vector<IdentityDocument> FileDidStore::list()
    {
        std::vector<IdentityDocument> out;

        std::error_code ec;
        if (!std::filesystem::is_directory(directory_, ec))
            return out;

        for (const auto &entry : std::filesystem::directory_iterator(directory_, ec))
        {
            if (!entry.is_regular_file(ec) || entry.path().extension() != ".json")
                continue;

            const std::string name = entry.path().stem().string();
            auto doc = load(name);
            if (!doc)
            {
                log::logger()->warn("skipping {}: {}", entry.path().string(), doc.error().what());
                continue;
            }
            if (*doc)
                out.push_back(std::move(**doc));
        }

        std::sort(out.begin(), out.end(), [](const IdentityDocument &a, const IdentityDocument &b)
                  { return a.name() < b.name(); });
        return out;
    }

    Result<bool> FileDidStore::remove(const std::string &name)
    {
        auto path = path_for(name);
        if (!path)
            return std::unexpected(path.error());

        std::error_code ec;
        const bool removed = std::filesystem::remove(*path, ec);
        if (ec)
        {
            return std::unexpected(AeonError::io(
                std::format("Failed to remove {}: {}", path->string(), ec.message())));
        }
        if (removed)
            log::logger()->info("removed {}{}", kDidPrefix, name);
        return removed;
    }

} // namespace aeon
