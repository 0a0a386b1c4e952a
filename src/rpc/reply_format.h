// src/rpc/reply_format.h
#pragma once

#include <string>

#include "idlease.pb.h"

namespace idlease {

// {"id": <id>, "exp": <exp>} 或 {"error": {"code": <code>, "msg": "<msg>"}}
// 空 reply 返回空串
std::string format_reply_json(const wire::LeaseReply& rsp);

// JSON 字符串转义，不含两侧引号
std::string json_escape(const std::string& s);

} // namespace idlease
