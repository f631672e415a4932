#include <gtest/gtest.h>

#include <string>

#include "../src/http/api/status.hpp"
#include "../src/http/error/errors.hpp"
#include "../src/http/model/model.hpp"

using tfe::http::api::check_response_code;
using tfe::http::model::Response;

namespace {
    Response response(long status, const std::string& body) {
        Response r;
        r.status_ = status;
        r.body_ = body;
        r.effective_url_ = "https://example.com/api/v2/thing";
        return r;
    }
}  // namespace

TEST(StatusTest, SuccessRangeLeavesBodyForTheDecoder) {
    for (long status : {200L, 201L, 204L, 299L}) {
        Response r = response(status, "{\"data\":null}");
        EXPECT_NO_THROW(check_response_code(r)) << status;
        EXPECT_EQ(r.body_, "{\"data\":null}");
    }
}

TEST(StatusTest, NotFoundIgnoresBody) {
    for (const char* body : {"", "not json", "{\"errors\":[{\"status\":\"404\"}]}"}) {
        Response r = response(404, body);
        try {
            check_response_code(r);
            FAIL() << "expected NotFoundError";
        } catch (const tfe::http::error::NotFoundError& e) {
            EXPECT_EQ(e.status_, 404);
            EXPECT_EQ(e.url_, "https://example.com/api/v2/thing");
        }
    }
}

TEST(StatusTest, UnexpectedStatusCarriesCodeAndBody) {
    Response r = response(500, "boom");
    try {
        check_response_code(r);
        FAIL() << "expected UnexpectedStatusError";
    } catch (const tfe::http::error::UnexpectedStatusError& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("500"), std::string::npos);
        EXPECT_NE(msg.find("boom"), std::string::npos);
        EXPECT_EQ(e.status_, 500);
        EXPECT_EQ(e.body_, "boom");
    }
    EXPECT_TRUE(r.body_.empty());
}

TEST(StatusTest, EveryOtherCodeOutsideTwoHundredsIsUnexpected) {
    for (long status : {0L, 100L, 199L, 300L, 302L, 401L, 403L, 422L, 503L}) {
        Response r = response(status, "");
        EXPECT_THROW(check_response_code(r), tfe::http::error::UnexpectedStatusError) << status;
    }
}

TEST(StatusTest, ErrorsShareTheClientErrorBase) {
    Response r = response(404, "");
    EXPECT_THROW(check_response_code(r), tfe::http::error::ClientError);
}
