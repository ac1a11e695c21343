#include "leasekeeper/storage/json/JsonSnapshotRepositoryFactory.hpp"

#include "leasekeeper/logging/LogRegistry.hpp"
#include "leasekeeper/storage/StorageErrors.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>
#include <utility>

namespace leasekeeper::storage::json
{
namespace
{

constexpr const char* g_kTempSuffix{ ".tmp" };
constexpr int g_kIndent{ 2 };

[[nodiscard]] std::filesystem::path tempPathFor(const std::filesystem::path& file)
{
    std::filesystem::path tmp{ file };
    tmp += g_kTempSuffix;
    return tmp;
}

void ensureParentDir(const std::filesystem::path& file)
{
    const auto parent{ file.parent_path() };
    if (parent.empty())
    {
        return;
    }

    std::error_code ec{};
    if (std::filesystem::is_directory(parent, ec))
    {
        return;
    }
    ec.clear();
    if (!std::filesystem::create_directories(parent, ec) || ec)
    {
        throw leasekeeper::storage::PersistenceIoError("storage: failed to create snapshot directory " +
                                                       parent.string());
    }
}

[[nodiscard]] nlohmann::json readDocument(const std::filesystem::path& file)
{
    std::ifstream in{ file, std::ios::binary };
    if (!in)
    {
        throw leasekeeper::storage::PersistenceIoError("storage: failed to open snapshot for reading: " +
                                                       file.string());
    }

    auto doc{ nlohmann::json::parse(in, nullptr, false) };
    if (in.bad())
    {
        throw leasekeeper::storage::PersistenceIoError("storage: failed to read snapshot: " + file.string());
    }
    if (doc.is_discarded())
    {
        throw leasekeeper::storage::SnapshotFormatError("storage: snapshot is not valid JSON: " + file.string());
    }
    if (!doc.is_object())
    {
        throw leasekeeper::storage::SnapshotFormatError("storage: snapshot root must be a JSON object: " +
                                                        file.string());
    }
    return doc;
}

class JsonSnapshotRepository final : public leasekeeper::storage::ISnapshotRepository
{
public:
    explicit JsonSnapshotRepository(std::filesystem::path file) : m_file(std::move(file))
    {
    }

    [[nodiscard]] std::optional<leasekeeper::storage::LoadedSnapshot> load() const override
    {
        std::error_code ec{};
        const bool present{ std::filesystem::exists(m_file, ec) };
        if (ec)
        {
            throw leasekeeper::storage::PersistenceIoError("storage: failed to stat snapshot: " + m_file.string());
        }
        if (!present)
        {
            return std::nullopt;
        }

        const auto doc{ readDocument(m_file) };

        leasekeeper::storage::LoadedSnapshot out{};
        out.sessions.reserve(doc.size());
        for (const auto& [id, value] : doc.items())
        {
            if (!value.is_number())
            {
                ++out.skippedEntries;
                leasekeeper::logging::LogRegistry::persistence()->warn(
                    "Skipping snapshot entry {} with non-numeric expiry", id);
                continue;
            }
            out.sessions.push_back(leasekeeper::storage::PersistedSession{ id, value.get<double>() });
        }
        return out;
    }

    void save(const std::vector<leasekeeper::storage::PersistedSession>& sessions) override
    {
        nlohmann::json doc = nlohmann::json::object();
        for (const auto& session : sessions)
        {
            doc[session.id] = session.expiresAtUnix;
        }
        const std::string text{ doc.dump(g_kIndent, ' ', false, nlohmann::json::error_handler_t::replace) };

        ensureParentDir(m_file);

        // The previous snapshot stays intact until the rename succeeds.
        const auto tmp{ tempPathFor(m_file) };
        {
            std::ofstream out{ tmp, std::ios::binary | std::ios::trunc };
            if (!out)
            {
                throw leasekeeper::storage::PersistenceIoError("storage: failed to open snapshot for writing: " +
                                                               tmp.string());
            }
            out.write(text.data(), static_cast<std::streamsize>(text.size()));
            out.flush();
            if (!out)
            {
                out.close();
                std::error_code ignored{};
                std::filesystem::remove(tmp, ignored);
                throw leasekeeper::storage::PersistenceIoError("storage: failed to write snapshot: " + tmp.string());
            }
        }

        std::error_code ec{};
        std::filesystem::rename(tmp, m_file, ec);
        if (ec)
        {
            std::error_code ignored{};
            std::filesystem::remove(tmp, ignored);
            throw leasekeeper::storage::PersistenceIoError("storage: failed to replace snapshot " + m_file.string() +
                                                           ": " + ec.message());
        }
    }

    [[nodiscard]] const std::filesystem::path& location() const noexcept override
    {
        return m_file;
    }

private:
    std::filesystem::path m_file;
};

} // namespace

std::unique_ptr<leasekeeper::storage::ISnapshotRepository> makeJsonSnapshotRepository(std::filesystem::path file)
{
    return std::make_unique<JsonSnapshotRepository>(std::move(file));
}

} // namespace leasekeeper::storage::json
