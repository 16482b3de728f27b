#include "requestmodule.h"

#include <exception>
#include <string>

namespace {

std::string toString(const pj_str_t &str)
{
    if (str.slen <= 0) {
        return std::string();
    }
    return std::string(str.ptr, static_cast<std::size_t>(str.slen));
}

class StatelessSender : public ivr::ResponseSender
{
public:
    StatelessSender(pjsip_endpoint *endpt, pjsip_rx_data *rdata) :
        endpt_(endpt),
        rdata_(rdata) {}

    virtual void sendResponse(const ivr::SipRequest &request, int status_code, const std::string &reason) override
    {
        pj_str_t text = pj_str(const_cast<char *>(reason.c_str()));
        pj_status_t status = pjsip_endpt_respond_stateless(endpt_, rdata_, status_code, &text, NULL, NULL);
        if (status != PJ_SUCCESS) {
            char buf[PJ_ERR_MSG_SIZE];
            pj_strerror(status, buf, sizeof(buf));
            throw ivr::SignalingError("Cannot respond to " + request.method + ": " + buf);
        }
    }

private:
    pjsip_endpoint *endpt_;
    pjsip_rx_data *rdata_;
};

} // namespace

ivr::RequestModule *ivr::RequestModule::instance_ = nullptr;

ivr::RequestModule::RequestModule(Logger &logger, RequestHandler &handler) :
    logger_(logger),
    handler_(handler),
    endpt_(nullptr)
{
    pj_bzero(&module_, sizeof(module_));
    module_.name = pj_str(const_cast<char *>("mod-ivr-requests"));
    module_.id = -1;
    module_.priority = PJSIP_MOD_PRIORITY_UA_PROXY_LAYER - 1;
    module_.on_rx_request = &RequestModule::onRxRequest;
}

ivr::RequestModule::~RequestModule()
{
    unregisterModule();
}

void ivr::RequestModule::registerModule(pjsip_endpoint *endpt)
{
    if (instance_) {
        throw SignalingError("Request module is already registered");
    }
    pj_status_t status = pjsip_endpt_register_module(endpt, &module_);
    if (status != PJ_SUCCESS) {
        char buf[PJ_ERR_MSG_SIZE];
        pj_strerror(status, buf, sizeof(buf));
        throw SignalingError(std::string("Cannot register request module: ") + buf);
    }
    endpt_ = endpt;
    instance_ = this;
}

void ivr::RequestModule::unregisterModule()
{
    if (!endpt_) {
        return;
    }
    pjsip_endpt_unregister_module(endpt_, &module_);
    endpt_ = nullptr;
    instance_ = nullptr;
}

ivr::SipRequest ivr::RequestModule::toSipRequest(const pjsip_rx_data *rdata)
{
    SipRequest request;
    const pjsip_msg *msg = rdata->msg_info.msg;
    request.method = toString(msg->line.req.method.name);

    char uri[PJSIP_MAX_URL_SIZE];
    int len = pjsip_uri_print(PJSIP_URI_IN_REQ_URI, msg->line.req.uri, uri, sizeof(uri));
    if (len > 0) {
        request.uri.assign(uri, static_cast<std::size_t>(len));
    }

    if (rdata->msg_info.cid) {
        request.call_id = toString(rdata->msg_info.cid->id);
    }
    if (rdata->msg_info.from) {
        request.from_tag = toString(rdata->msg_info.from->tag);
    }
    if (rdata->msg_info.to) {
        request.to_tag = toString(rdata->msg_info.to->tag);
    }

    request.source = std::string(rdata->pkt_info.src_name) + ":" + std::to_string(rdata->pkt_info.src_port);
    if (rdata->tp_info.transport) {
        const pjsip_host_port &local = rdata->tp_info.transport->local_name;
        request.local = toString(local.host) + ":" + std::to_string(local.port);
    }
    return request;
}

pj_bool_t ivr::RequestModule::onRxRequest(pjsip_rx_data *rdata)
{
    RequestModule *self = instance_;
    if (!self) {
        return PJ_FALSE;
    }

    try {
        SipRequest request = toSipRequest(rdata);
        StatelessSender sender(self->endpt_, rdata);
        return self->handler_.handle(request, sender) ? PJ_TRUE : PJ_FALSE;
    }
    catch (const std::exception &e) {
        self->logger_.error(std::string("Failed to handle request: ") + e.what());
    }
    return PJ_FALSE;
}
