#include <gtest/gtest.h>

#include <httplib.h>

#include <string>
#include <thread>
#include <vector>

#include "ApiClient.hpp"
#include "ByteStream.hpp"
#include "TestUtils.hpp"

using namespace neurosync;
using namespace neurosync::test;
using json = nlohmann::json;

namespace {

// httplib server on an ephemeral loopback port, run on its own thread.
class LocalServer
{
public:
    httplib::Server server;

    ~LocalServer() { stop(); }

    void start()
    {
        m_port = server.bind_to_any_port("127.0.0.1");
        ASSERT_GT(m_port, 0);
        m_thread = std::thread([this] { server.listen_after_bind(); });
        server.wait_until_ready();
    }

    void stop()
    {
        if (m_thread.joinable())
        {
            server.stop();
            m_thread.join();
        }
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(m_port); }

private:
    int m_port = 0;
    std::thread m_thread;
};

void replyJson(httplib::Response &res, const json &body, int status = 200)
{
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

class ApiClientServerTest : public ::testing::Test
{
protected:
    LocalServer host;
    TempDir dir;

    ClientConfig config(bool withToken = true) const
    {
        ClientConfig c;
        c.server = host.url();
        if (withToken)
            c.token = "secret";
        return c;
    }
};

} // namespace

TEST(ApiClient, UrlEncodeKeepsUnreservedCharacters)
{
    EXPECT_EQ(urlEncode("ds000001"), "ds000001");
    EXPECT_EQ(urlEncode("1.0.0-rc_1~"), "1.0.0-rc_1~");
    EXPECT_EQ(urlEncode("a b/c?"), "a%20b%2Fc%3F");
}

TEST(ApiClient, DatasetIdValidation)
{
    EXPECT_NO_THROW(validateDatasetId("ds000001"));
    EXPECT_THROW(validateDatasetId(""), RemoteError);
    EXPECT_THROW(validateDatasetId("ds1/../../admin"), RemoteError);
    EXPECT_THROW(validateDatasetId("ds1?x=1"), RemoteError);
    EXPECT_THROW(validateDatasetId("ds 1"), RemoteError);
    EXPECT_THROW(validateDatasetId(".."), RemoteError);
}

TEST(ApiClient, DatasetPath)
{
    EXPECT_EQ(ApiClient::datasetPath("ds000001", std::nullopt),
              "/crn/datasets/ds000001/download");
    EXPECT_EQ(ApiClient::datasetPath("ds000001", std::string("1.0.0")),
              "/crn/datasets/ds000001/snapshots/1.0.0/download");
    EXPECT_THROW(ApiClient::datasetPath("a/b", std::nullopt), RemoteError);
}

TEST(ApiClient, SplitUrl)
{
    auto [origin, target] = splitUrl("https://openneuro.org:8443/crn/datasets/ds1/objects/abc?x=1");
    EXPECT_EQ(origin, "https://openneuro.org:8443");
    EXPECT_EQ(target, "/crn/datasets/ds1/objects/abc?x=1");

    EXPECT_EQ(splitUrl("http://localhost").second, "/");
    EXPECT_THROW(splitUrl("/relative/path"), TransferError);
}

TEST(ApiClient, FileTreeForTopLevelFile)
{
    std::string slot;
    json tree = buildFileTree("README", slot);

    EXPECT_EQ(slot, "variables.files.files.0");
    EXPECT_EQ(tree["name"], "");
    ASSERT_EQ(tree["files"].size(), 1u);
    EXPECT_TRUE(tree["files"][0].is_null());
    EXPECT_TRUE(tree["directories"].empty());
}

TEST(ApiClient, FileTreeForNestedFile)
{
    std::string slot;
    json tree = buildFileTree("sub-01\\anat/./T1w.nii.gz", slot);

    EXPECT_EQ(slot, "variables.files.directories.0.directories.0.files.0");
    const json &sub = tree["directories"][0];
    EXPECT_EQ(sub["name"], "sub-01");
    EXPECT_TRUE(sub["files"].empty());
    const json &anat = sub["directories"][0];
    EXPECT_EQ(anat["name"], "anat");
    ASSERT_EQ(anat["files"].size(), 1u);
    EXPECT_TRUE(anat["directories"].empty());
}

TEST(ApiClient, FileTreeRejectsEmptyPath)
{
    std::string slot;
    EXPECT_THROW(buildFileTree("./", slot), TransferError);
}

TEST(ApiClient, AnonymousClientRefusesMutations)
{
    ClientConfig config;
    config.server = "http://127.0.0.1:9";
    ApiClient client(config);

    EXPECT_FALSE(client.authenticated());
    EXPECT_THROW(client.createDataset(), AuthError);
    EXPECT_THROW(client.publishDataset("ds000001"), AuthError);
    EXPECT_THROW(client.deleteFile("ds000001", "a.txt"), AuthError);
}

TEST(ApiClient, TokenMakesClientAuthenticated)
{
    ClientConfig config;
    config.server = "http://127.0.0.1:9";
    config.token = "secret";
    EXPECT_TRUE(ApiClient(config).authenticated());
}

TEST(ApiClient, DefaultHttpsServerIsAccepted)
{
    ClientConfig config;
    ASSERT_EQ(config.server, "https://openneuro.org");
    EXPECT_NO_THROW(ApiClient client(config));
}

TEST(ApiClient, UnsupportedSchemeIsConfigError)
{
    ClientConfig config;
    config.server = "ftp://openneuro.org";
    EXPECT_THROW(ApiClient client(config), ConfigError);
}

TEST_F(ApiClientServerTest, ListingIsParsedAndCarriesCredentials)
{
    std::string cookie;
    std::string agent;
    host.server.Get("/crn/datasets/ds000001/download",
                    [&](const httplib::Request &req, httplib::Response &res)
                    {
                        cookie = req.get_header_value("Cookie");
                        agent = req.get_header_value("User-Agent");
                        replyJson(res, {{"datasetId", "ds000001"},
                                        {"files",
                                         {{{"filename", "sub-01/anat/T1w.nii.gz"},
                                           {"size", 12},
                                           {"urls", {"https://mirror.example/a", "https://b"}}},
                                          {{"filename", "README"}, {"size", 0}}}}});
                    });
    host.start();

    ApiClient client(config());
    RemoteListing listing = client.listFiles("ds000001", std::nullopt);

    EXPECT_EQ(listing.datasetId, "ds000001");
    ASSERT_EQ(listing.files.size(), 2u);
    EXPECT_EQ(listing.files[0].filename, "sub-01/anat/T1w.nii.gz");
    EXPECT_EQ(listing.files[0].size, 12);
    EXPECT_EQ(listing.files[0].urls,
              (std::vector<std::string>{"https://mirror.example/a", "https://b"}));
    EXPECT_EQ(listing.files[1].size, 0);
    EXPECT_TRUE(listing.files[1].urls.empty());
    EXPECT_EQ(cookie, "accessToken=secret");
    EXPECT_EQ(agent.rfind("neurosync/", 0), 0u);
}

TEST_F(ApiClientServerTest, SnapshotListingWithoutToken)
{
    std::string cookie = "unset";
    host.server.Get("/crn/datasets/ds000001/snapshots/1.0.0/download",
                    [&](const httplib::Request &req, httplib::Response &res)
                    {
                        cookie = req.get_header_value("Cookie");
                        replyJson(res, {{"datasetId", "ds000001"}, {"files", json::array()}});
                    });
    host.start();

    ApiClient client(config(false));
    RemoteListing listing = client.listFiles("ds000001", std::string("1.0.0"));
    EXPECT_TRUE(listing.files.empty());
    EXPECT_EQ(cookie, "");
}

TEST_F(ApiClientServerTest, MalformedListingIsRemoteError)
{
    host.server.Get("/crn/datasets/bad-json/download",
                    [](const httplib::Request &, httplib::Response &res)
                    { res.set_content("<html>oops</html>", "text/html"); });
    host.server.Get("/crn/datasets/no-name/download",
                    [](const httplib::Request &, httplib::Response &res)
                    { replyJson(res, {{"files", {{{"size", 1}}}}}); });
    host.start();

    ApiClient client(config());
    EXPECT_THROW(client.listFiles("bad-json", std::nullopt), RemoteError);
    EXPECT_THROW(client.listFiles("no-name", std::nullopt), RemoteError);
}

TEST_F(ApiClientServerTest, HttpStatusMapsToErrorType)
{
    host.server.Get("/crn/datasets/locked/download",
                    [](const httplib::Request &, httplib::Response &res) { res.status = 401; });
    host.server.Get("/crn/datasets/broken/download",
                    [](const httplib::Request &, httplib::Response &res) { res.status = 500; });
    host.server.Post("/crn/graphql",
                     [](const httplib::Request &, httplib::Response &res) { res.status = 403; });
    host.server.Get("/missing",
                    [](const httplib::Request &, httplib::Response &res) { res.status = 404; });
    host.start();

    ApiClient client(config());
    EXPECT_THROW(client.listFiles("locked", std::nullopt), AuthError);
    try
    {
        client.listFiles("broken", std::nullopt);
        FAIL() << "expected RemoteError";
    }
    catch (const AuthError &)
    {
        FAIL() << "500 is not an authentication failure";
    }
    catch (const RemoteError &e)
    {
        EXPECT_NE(std::string(e.what()).find("HTTP 500"), std::string::npos);
    }
    EXPECT_THROW(client.publishDataset("ds000001"), AuthError);

    FileStream sink((dir / "missing").string(), FileStream::Mode::Write);
    EXPECT_THROW(client.download(host.url() + "/missing", sink), TransferError);
}

TEST_F(ApiClientServerTest, GraphqlErrorsAreRemoteErrors)
{
    host.server.Post("/crn/graphql",
                     [](const httplib::Request &, httplib::Response &res)
                     { replyJson(res, {{"errors", {{{"message", "dataset is locked"}}}}}); });
    host.start();

    ApiClient client(config());
    try
    {
        client.publishDataset("ds000001");
        FAIL() << "expected RemoteError";
    }
    catch (const RemoteError &e)
    {
        EXPECT_NE(std::string(e.what()).find("dataset is locked"), std::string::npos);
    }
}

TEST_F(ApiClientServerTest, CreateAndDeleteSendGraphqlMutations)
{
    std::vector<json> requests;
    host.server.Post("/crn/graphql",
                     [&](const httplib::Request &req, httplib::Response &res)
                     {
                         json body = json::parse(req.body);
                         requests.push_back(body);
                         if (body["query"].get<std::string>().find("createDataset") != std::string::npos)
                             replyJson(res, {{"data", {{"createDataset", {{"id", "ds000123"}}}}}});
                         else
                             replyJson(res, {{"data", {{"deleteFiles", true}}}});
                     });
    host.start();

    ApiClient client(config());
    EXPECT_EQ(client.createDataset(), "ds000123");
    client.deleteFile("ds000123", "sub-01/anat/T1w.nii.gz");

    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0]["variables"]["affirmedDefaced"], true);
    EXPECT_EQ(requests[1]["variables"]["datasetId"], "ds000123");
    EXPECT_EQ(requests[1]["variables"]["files"],
              json::parse(R"([{"path": "sub-01/anat", "filename": "T1w.nii.gz"}])"));
}

TEST_F(ApiClientServerTest, UploadSendsGraphqlMultipart)
{
    std::string operations;
    std::string map;
    std::string content;
    std::string filename;
    host.server.Post("/crn/graphql",
                     [&](const httplib::Request &req, httplib::Response &res)
                     {
                         if (!req.is_multipart_form_data())
                         {
                             res.status = 400;
                             return;
                         }
                         operations = req.form.get_field("operations");
                         map = req.form.get_field("map");
                         const auto file = req.form.get_file("0");
                         content = file.content;
                         filename = file.filename;
                         replyJson(res, {{"data", {{"updateFiles", true}}}});
                     });
    host.start();

    std::string payload(200000, 'n');
    writeFile(dir / "T1w.nii.gz", payload);
    FileStream source((dir / "T1w.nii.gz").string(), FileStream::Mode::Read);

    ApiClient client(config());
    client.uploadFile("ds000001", source, "sub-01/anat/T1w.nii.gz");

    EXPECT_EQ(content, payload);
    EXPECT_EQ(filename, "T1w.nii.gz");
    EXPECT_EQ(json::parse(map),
              json::parse(R"({"0": ["variables.files.directories.0.directories.0.files.0"]})"));
    json ops = json::parse(operations);
    EXPECT_EQ(ops["variables"]["datasetId"], "ds000001");
    EXPECT_EQ(ops["variables"]["files"]["directories"][0]["name"], "sub-01");
}

TEST_F(ApiClientServerTest, UploadRejectedByServerIsTransferError)
{
    host.server.Post("/crn/graphql",
                     [](const httplib::Request &, httplib::Response &res)
                     { replyJson(res, {{"errors", {{{"message", "quota exceeded"}}}}}); });
    host.start();

    writeFile(dir / "a.txt", "abc");
    FileStream source((dir / "a.txt").string(), FileStream::Mode::Read);

    ApiClient client(config());
    EXPECT_THROW(client.uploadFile("ds000001", source, "a.txt"), TransferError);
}

TEST_F(ApiClientServerTest, DownloadStreamsIntoDestination)
{
    std::string cookie;
    std::string payload(150000, 'd');
    host.server.Get("/crn/datasets/ds000001/objects/abc",
                    [&](const httplib::Request &req, httplib::Response &res)
                    {
                        cookie = req.get_header_value("Cookie");
                        res.set_content(payload, "application/octet-stream");
                    });
    host.start();

    ApiClient client(config());
    {
        FileStream sink((dir / "out").string(), FileStream::Mode::Write);
        client.download(host.url() + "/crn/datasets/ds000001/objects/abc", sink);
        EXPECT_EQ(sink.position(), static_cast<int64_t>(payload.size()));
    }
    EXPECT_EQ(readFile(dir / "out"), payload);
    EXPECT_EQ(cookie, "accessToken=secret");
}

TEST_F(ApiClientServerTest, MirrorOnOtherHostNeverSeesToken)
{
    LocalServer mirror;
    bool sawCookie = true;
    std::string agent;
    mirror.server.Get("/bucket/a.txt",
                      [&](const httplib::Request &req, httplib::Response &res)
                      {
                          sawCookie = req.has_header("Cookie");
                          agent = req.get_header_value("User-Agent");
                          res.set_content("mirrored", "text/plain");
                      });
    mirror.start();
    host.start();

    ApiClient client(config());
    {
        FileStream sink((dir / "a.txt").string(), FileStream::Mode::Write);
        client.download(mirror.url() + "/bucket/a.txt", sink);
    }
    EXPECT_EQ(readFile(dir / "a.txt"), "mirrored");
    EXPECT_FALSE(sawCookie);
    EXPECT_EQ(agent.rfind("neurosync/", 0), 0u);
}

TEST_F(ApiClientServerTest, CancelledDownloadStopsReceiving)
{
    host.server.Get("/big",
                    [](const httplib::Request &, httplib::Response &res)
                    { res.set_content(std::string(500000, 'z'), "application/octet-stream"); });
    host.start();

    CancellationToken cancel;
    cancel.cancel();
    ApiClient client(config(), &cancel);
    FileStream sink((dir / "big").string(), FileStream::Mode::Write);
    EXPECT_THROW(client.download(host.url() + "/big", sink), TransferError);
    EXPECT_EQ(sink.position(), 0);
}
