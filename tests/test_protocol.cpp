#include <catch2/catch_test_macros.hpp>

#include "protocol.hpp"

#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

TEST_CASE("Frame reader", "[protocol]") {
    FrameReader reader(64);
    std::string frame;

    SECTION("PartialReadsAssembleOneFrame") {
        reader.feed(R"({"id":"1",)");
        REQUIRE(reader.next(frame) == FrameReader::Status::NeedMore);
        reader.feed(R"("method":"get_user"})");
        REQUIRE(reader.next(frame) == FrameReader::Status::NeedMore);
        reader.feed("\n");
        REQUIRE(reader.next(frame) == FrameReader::Status::Frame);
        REQUIRE(frame == R"({"id":"1","method":"get_user"})");
        REQUIRE(reader.empty());
    }

    SECTION("SeveralFramesInOneRead") {
        reader.feed("{\"a\":1}\n{\"b\":2}\n{\"c\"");
        REQUIRE(reader.next(frame) == FrameReader::Status::Frame);
        REQUIRE(frame == "{\"a\":1}");
        REQUIRE(reader.next(frame) == FrameReader::Status::Frame);
        REQUIRE(frame == "{\"b\":2}");
        REQUIRE(reader.next(frame) == FrameReader::Status::NeedMore);
        REQUIRE(reader.buffered() == 4);
    }

    SECTION("BlankLinesAndCarriageReturnsSkipped") {
        reader.feed("\n  \r\n{\"a\":1}\r\n");
        REQUIRE(reader.next(frame) == FrameReader::Status::Frame);
        REQUIRE(frame == "{\"a\":1}");
        REQUIRE(reader.next(frame) == FrameReader::Status::NeedMore);
    }

    SECTION("OversizedCompleteLine") {
        reader.feed(std::string(65, 'x') + "\n");
        REQUIRE(reader.next(frame) == FrameReader::Status::TooLarge);
    }

    SECTION("OversizedPartialLine") {
        reader.feed(std::string(65, 'x'));
        REQUIRE(reader.next(frame) == FrameReader::Status::TooLarge);
    }

    SECTION("LineAtLimitAccepted") {
        reader.feed(std::string(64, 'x') + "\n");
        REQUIRE(reader.next(frame) == FrameReader::Status::Frame);
        REQUIRE(frame.size() == 64);
    }
}

TEST_CASE("Request decoding", "[protocol]") {

    SECTION("FullRequest") {
        auto req = decode_request(R"({"id":"abc","v":1,"method":"list_projects","params":{"limit":5}})");
        REQUIRE(req.has_value());
        REQUIRE(req->id == "abc");
        REQUIRE(req->version == 1);
        REQUIRE(req->method == "list_projects");
        REQUIRE(req->params["limit"] == 5);
    }

    SECTION("ParamsAndVersionOptional") {
        auto req = decode_request(R"({"id":"x","method":"get_user"})");
        REQUIRE(req.has_value());
        REQUIRE(req->params.is_object());
        REQUIRE(req->params.empty());

        auto with_null = decode_request(R"({"id":"x","method":"get_user","params":null})");
        REQUIRE(with_null.has_value());
        REQUIRE(with_null->params.is_object());
    }

    SECTION("NonObjectParamsPassedThrough") {
        auto req = decode_request(R"({"id":"x","method":"get_user","params":[1,2]})");
        REQUIRE(req.has_value());
        REQUIRE(req->params.is_array());
    }

    SECTION("InvalidJsonHasNoId") {
        auto req = decode_request("{not json");
        REQUIRE_FALSE(req.has_value());
        REQUIRE_FALSE(req.error().id.has_value());
        REQUIRE(req.error().outcome.error().kind == ErrorKind::MalformedRequest);
    }

    SECTION("NonObjectRejected") {
        auto req = decode_request("[1,2,3]");
        REQUIRE_FALSE(req.has_value());
        REQUIRE(req.error().outcome.error().kind == ErrorKind::MalformedRequest);
    }

    SECTION("NumericIdIsNotRecovered") {
        auto req = decode_request(R"({"id":7,"method":"get_user"})");
        REQUIRE_FALSE(req.has_value());
        REQUIRE_FALSE(req.error().id.has_value());
    }

    SECTION("MissingMethodKeepsId") {
        auto req = decode_request(R"({"id":"q1","v":1})");
        REQUIRE_FALSE(req.has_value());
        REQUIRE(req.error().id == "q1");
        REQUIRE(req.error().outcome.error().kind == ErrorKind::MalformedRequest);
    }

    SECTION("WrongVersionRejected") {
        auto req = decode_request(R"({"id":"q2","v":2,"method":"get_user"})");
        REQUIRE_FALSE(req.has_value());
        REQUIRE(req.error().id == "q2");
        REQUIRE(req.error().outcome.error().message == "unsupported protocol version");
    }
}

TEST_CASE("Response encoding", "[protocol]") {

    SECTION("SuccessShape") {
        auto frame = encode_frame(Response::success("1", {{"count", 0}}));
        REQUIRE(frame.back() == '\n');
        REQUIRE(frame.find('\n') == frame.size() - 1);

        auto j = json::parse(frame);
        REQUIRE(j["id"] == "1");
        REQUIRE(j["ok"] == true);
        REQUIRE(j["result"]["count"] == 0);
        REQUIRE_FALSE(j.contains("error"));
    }

    SECTION("ErrorShape") {
        auto j = to_json(Response::failure("2", {ErrorKind::InvalidParams, "missing deployment_id"}));
        REQUIRE(j["id"] == "2");
        REQUIRE(j["ok"] == false);
        REQUIRE(j["error"]["kind"] == "InvalidParams");
        REQUIRE(j["error"]["message"] == "missing deployment_id");
        REQUIRE_FALSE(j.contains("result"));
        REQUIRE_FALSE(j["error"].contains("retry_after"));
    }

    SECTION("UnrecoverableIdIsNull") {
        auto j = to_json(Response::failure(std::nullopt, {ErrorKind::MalformedRequest, "bad"}));
        REQUIRE(j["id"].is_null());
    }

    SECTION("RetryAfterIncluded") {
        auto j = to_json(Response::failure("3", {ErrorKind::RateLimited, "slow down", 12}));
        REQUIRE(j["error"]["kind"] == "RateLimited");
        REQUIRE(j["error"]["retry_after"] == 12);
    }

    SECTION("ResultNewlinesStayEscaped") {
        auto frame = encode_frame(Response::success("4", {{"message", "line1\nline2"}}));
        REQUIRE(frame.find('\n') == frame.size() - 1);
    }
}
