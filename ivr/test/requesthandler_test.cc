#include "requesthandler.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>

using ::testing::_;
using ::testing::Field;
using ::testing::StrictMock;

namespace {

class MockResponseSender : public ivr::ResponseSender
{
public:
    MOCK_METHOD3(sendResponse, void(const ivr::SipRequest &, int, const std::string &));
};

ivr::SipRequest request(const std::string &method, bool in_dialog = false)
{
    ivr::SipRequest req;
    req.method = method;
    req.uri = "sip:ivr@192.0.2.1";
    req.call_id = "4711@192.0.2.10";
    req.from_tag = "from-tag";
    if (in_dialog) {
        req.to_tag = "to-tag";
    }
    req.source = "192.0.2.10:5060";
    return req;
}

class RequestHandlerTest : public ::testing::Test
{
protected:
    RequestHandlerTest() :
        logger_(out_, err_),
        handler_(logger_)
    {
    }

    std::ostringstream out_;
    std::ostringstream err_;
    ivr::Logger logger_;
    ivr::RequestHandler handler_;
    StrictMock<MockResponseSender> sender_;
};

} // namespace

TEST_F(RequestHandlerTest, ByeOutsideDialog)
{
    EXPECT_CALL(sender_, sendResponse(Field(&ivr::SipRequest::method, "BYE"), 481,
                                      "Call Leg/Transaction Does Not Exist"));
    EXPECT_TRUE(handler_.handle(request("BYE"), sender_));
}

TEST_F(RequestHandlerTest, SubscribeNotAllowed)
{
    EXPECT_CALL(sender_, sendResponse(_, 405, "Method Not Allowed"));
    EXPECT_TRUE(handler_.handle(request("SUBSCRIBE"), sender_));
}

TEST_F(RequestHandlerTest, OptionsAndRegisterAccepted)
{
    EXPECT_CALL(sender_, sendResponse(_, 200, "OK")).Times(2);
    EXPECT_TRUE(handler_.handle(request("OPTIONS"), sender_));
    EXPECT_TRUE(handler_.handle(request("REGISTER"), sender_));
}

TEST_F(RequestHandlerTest, InviteLeftToCallHandling)
{
    EXPECT_FALSE(handler_.handle(request("INVITE"), sender_));
    EXPECT_FALSE(handler_.handle(request("MESSAGE"), sender_));
}

TEST_F(RequestHandlerTest, InDialogRequestsSkipped)
{
    EXPECT_FALSE(handler_.handle(request("BYE", true), sender_));
    EXPECT_FALSE(handler_.handle(request("OPTIONS", true), sender_));
    EXPECT_TRUE(ivr::RequestHandler::isInDialog(request("BYE", true)));
    EXPECT_FALSE(ivr::RequestHandler::isInDialog(request("BYE")));
}
