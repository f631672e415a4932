#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "../src/http/api/client.hpp"
#include "../src/http/api/config.hpp"
#include "../src/http/error/errors.hpp"
#include "../src/http/transport/curl_easy.hpp"
#include "../src/utils/constants.hpp"
#include "fake_transport.hpp"

using tfe::http::api::Client;
using tfe::http::api::Config;
using tfe::test::FakeTransport;

TEST(ClientTest, DefaultConfigPointsAtDefaultAddress) {
    const Config c = tfe::http::api::default_config();

    EXPECT_EQ(c.address_, tfe::constants::DEFAULT_ADDRESS);
    EXPECT_TRUE(c.token_.empty());
    EXPECT_EQ(c.transport_, nullptr);
}

TEST(ClientTest, MissingConfigIsRejected) {
    try {
        (void)tfe::http::api::new_client(nullptr);
        FAIL() << "expected ConfigError";
    } catch (const tfe::http::error::ConfigError& e) {
        EXPECT_STREQ(e.what(), "Missing client config");
    }
}

TEST(ClientTest, EmptyTokenIsRejectedWithoutAnyRequest) {
    auto transport = FakeTransport::returning(200, "");

    for (const char* address : {"", "https://tfe.example.com"}) {
        const Config c{.address_ = address, .token_ = "", .transport_ = transport};
        EXPECT_THROW(Client{c}, tfe::http::error::ConfigError);
        EXPECT_THROW((void)tfe::http::api::new_client(&c), tfe::http::error::ConfigError);
    }
    EXPECT_EQ(transport->calls(), 0U);
}

TEST(ClientTest, EmptyAddressFallsBackToDefault) {
    const Client client(Config{.address_ = "", .token_ = "secret", .transport_ = FakeTransport::returning(200, "")});

    EXPECT_EQ(client.address(), tfe::constants::DEFAULT_ADDRESS);
    EXPECT_EQ(client.token(), "secret");
}

TEST(ClientTest, CallerAddressOverridesDefault) {
    const Client client(Config{.address_ = "https://tfe.example.com", .token_ = "secret", .transport_ = FakeTransport::returning(200, "")});

    EXPECT_EQ(client.address(), "https://tfe.example.com");
}

TEST(ClientTest, InvalidAddressIsRejected) {
    const Config c{.address_ = "tfe.example.com", .token_ = "secret", .transport_ = FakeTransport::returning(200, "")};

    EXPECT_THROW(Client{c}, tfe::http::error::ConfigError);
}

TEST(ClientTest, UsesCallerTransport) {
    auto transport = FakeTransport::returning(200, "");
    const Client client(Config{.address_ = "", .token_ = "secret", .transport_ = transport});

    EXPECT_EQ(client.transport().get(), transport.get());
}

TEST(ClientTest, BuildsDefaultCurlTransportWhenNoneGiven) {
    const Client client(Config{.address_ = "", .token_ = "secret", .transport_ = nullptr});

    ASSERT_NE(client.transport(), nullptr);
    EXPECT_NE(dynamic_cast<tfe::http::transport::CurlEasy*>(client.transport().get()), nullptr);
}

TEST(ClientTest, ConstructionSendsNothing) {
    auto transport = FakeTransport::returning(200, "");
    const Config c{.address_ = "", .token_ = "t", .transport_ = transport};
    const auto client = tfe::http::api::new_client(&c);

    ASSERT_NE(client, nullptr);
    EXPECT_EQ(transport->calls(), 0U);
}
