#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include "Cancellation.hpp"
#include "Config.hpp"
#include "RemoteService.hpp"

namespace neurosync {

    // Percent-encodes everything except RFC 3986 unreserved characters.
    std::string urlEncode(const std::string& value);

    // Throws RemoteError for ids that cannot be placed in a URL path.
    void validateDatasetId(const std::string& datasetId);

    // "https://host:port/a/b?c" -> {"https://host:port", "/a/b?c"}
    std::pair<std::string, std::string> splitUrl(const std::string& url);

    // Nested FileTree variable holding one upload slot for remotePath.
    // uploadSlot receives the GraphQL multipart map path of that slot.
    nlohmann::json buildFileTree(const std::string& remotePath,
                                 std::string& uploadSlot);

    /**
     * ApiClient talks to an OpenNeuro server.
     * Uses cpp-httplib for networking and nlohmann/json for serialization.
     * Listings come from the REST download endpoint, mutations go through
     * GraphQL (uploads as GraphQL multipart requests).
     */
    class ApiClient : public RemoteService {
    public:
        explicit ApiClient(const ClientConfig& config,
                           const CancellationToken* cancel = nullptr);
        ~ApiClient() override;

        bool authenticated() const override;

        std::string createDataset() override;
        RemoteListing listFiles(const std::string& datasetId,
                                const std::optional<std::string>& version) override;
        void uploadFile(const std::string& datasetId, ByteStream& source,
                        const std::string& remotePath) override;
        void deleteFile(const std::string& datasetId,
                        const std::string& remotePath) override;
        void publishDataset(const std::string& datasetId) override;
        void download(const std::string& url, ByteStream& destination) override;

        // Path of the listing endpoint, relative to the server root.
        static std::string datasetPath(const std::string& datasetId,
                                       const std::optional<std::string>& version);

    private:
        struct Impl;
        std::unique_ptr<Impl> m_impl;
        ClientConfig m_config;
        const CancellationToken* m_cancel;

        bool cancelled() const;
        void requireToken(const std::string& operation) const;
    };

} // namespace neurosync
