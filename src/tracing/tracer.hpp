#pragma once

#include "common/types.hpp"

#include <memory>
#include <string_view>

// ---------------------------------------------------------------------------
// Span
//   추적 구간 하나. 객체가 소멸될 때 구간이 끝난다.
// ---------------------------------------------------------------------------
class Span {
public:
    virtual ~Span() = default;

    virtual void set_attribute(std::string_view key, std::string_view value) = 0;
    virtual void record_error(const Error& error) = 0;
};

// ---------------------------------------------------------------------------
// Tracer
//   연결 수립 / 문장 실행 구간을 외부 추적 시스템에 전달하는 hook.
//   ConnectionConfig::set_tracer() 로 주입하며, 없으면 추적하지 않는다.
//
//   span 이름:
//     "connect"           : TCP 연결 + 핸드셰이크
//     "execute_query"     : COM_QUERY (result set)
//     "execute_update"    : COM_QUERY (OK)
//     "prepare"           : COM_STMT_PREPARE
//     "execute_prepared"  : COM_STMT_EXECUTE
// ---------------------------------------------------------------------------
class Tracer {
public:
    virtual ~Tracer() = default;

    [[nodiscard]] virtual auto start_span(std::string_view name) -> std::unique_ptr<Span> = 0;
};

// tracer 가 없으면 nullptr 를 돌려주는 도우미
[[nodiscard]] inline auto start_span(const std::shared_ptr<Tracer>& tracer, std::string_view name)
    -> std::unique_ptr<Span>
{
    return tracer ? tracer->start_span(name) : nullptr;
}
