#pragma once

#include "common/error_codes.h"
#include "common/logger.h"

// MySQL 存储实现共用：连接失效时直接返回 ServiceUnavailable（减少重复代码）
#define CHECK_CONN(Conn, ResultType)                                            \
    if (!Conn->Valid()) {                                                       \
        LOG_ERROR("mysql_conn is invalid");                                     \
        return ResultType::Fail(ErrorCode::ServiceUnavailable);                 \
    }

// 存储层异常统一转换为"模糊信息"，细节只进日志
#define STORE_FAIL(ResultType, what, e)                                         \
    do {                                                                        \
        LOG_ERROR("{} failed: {}", what, e.what());                             \
        return ResultType::Fail(ErrorCode::ServiceUnavailable);                 \
    } while (0)
