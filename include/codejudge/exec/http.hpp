#pragma once

#include <optional>
#include <string>
#include "codejudge/common/cancellation.hpp"

namespace codejudge {

struct http_response {
    long status = 0;
    std::string body;

    bool ok() const;
};

/**
 * @brief 通过 libcurl 发出 HTTP 请求
 * @param method GET 或 POST
 * @param url 完整地址
 * @param json_body POST 的 JSON 请求体，GET 时为空
 * @param timeout_ms 整个请求的超时时间
 * @param token 可选的取消标记，被取消时中止传输
 * @return 服务器的响应，包括非 2xx 响应
 * @throws network_error 连接失败、超时等传输错误
 * @throws cancelled_error 传输被取消
 */
http_response http_request(const std::string &method, const std::string &url,
                           const std::optional<std::string> &json_body, int timeout_ms,
                           const cancellation_token *token = nullptr);

}  // namespace codejudge
