#pragma once

#include "client/connection.hpp"
#include "client/connection_config.hpp"
#include "common/types.hpp"

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/this_coro.hpp>

#include <exception>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

// ---------------------------------------------------------------------------
// ConnectionProvider<A>
//   ConnectionConfig + before / after hook. use() 가 연결의 수명을 관리한다.
//
//   use(body) 순서:
//     1. 연결 + 핸드셰이크 (실패 시 그대로 반환, hook 미실행)
//     2. before(conn) → A      (실패 시 연결을 닫고 body / after 를 건너뛴다)
//     3. body(conn)
//     4. after(A, conn)        (body 가 실패하거나 예외를 던져도 실행)
//     5. close
//   body 의 예외는 after / close 가 끝난 뒤 다시 던진다.
//   결과 우선순위: body 오류 > after 오류 > body 값.
//
//   provider 는 use() 가 끝날 때까지 살아 있어야 한다.
//   hook 은 shared_ptr<std::function> 으로 보관하며 operator== 는
//   설정 값 비교 + hook 포인터 동일성 비교이다.
// ---------------------------------------------------------------------------
template <typename A = std::monostate>
class ConnectionProvider {
public:
    using Before = std::function<boost::asio::awaitable<std::expected<A, Error>>(Connection&)>;
    using After  = std::function<boost::asio::awaitable<std::expected<void, Error>>(A&, Connection&)>;

    ConnectionProvider() = default;
    explicit ConnectionProvider(ConnectionConfig config) : config_(std::move(config)) {}

    ConnectionProvider(ConnectionConfig        config,
                       std::shared_ptr<Before> before,
                       std::shared_ptr<After>  after)
        : config_(std::move(config))
        , before_(std::move(before))
        , after_(std::move(after))
    {}

    // -----------------------------------------------------------------------
    // 설정 전달 (hook 은 유지된다)
    // -----------------------------------------------------------------------
    [[nodiscard]] auto set_host(std::string host) const -> ConnectionProvider {
        return with_config(config_.set_host(std::move(host)));
    }
    [[nodiscard]] auto set_port(std::uint16_t port) const -> ConnectionProvider {
        return with_config(config_.set_port(port));
    }
    [[nodiscard]] auto set_user(std::string user) const -> ConnectionProvider {
        return with_config(config_.set_user(std::move(user)));
    }
    [[nodiscard]] auto set_password(std::optional<std::string> password) const -> ConnectionProvider {
        return with_config(config_.set_password(std::move(password)));
    }
    [[nodiscard]] auto set_database(std::optional<std::string> database) const -> ConnectionProvider {
        return with_config(config_.set_database(std::move(database)));
    }
    [[nodiscard]] auto set_debug(bool debug) const -> ConnectionProvider {
        return with_config(config_.set_debug(debug));
    }
    [[nodiscard]] auto set_ssl(SslMode ssl) const -> ConnectionProvider {
        return with_config(config_.set_ssl(std::move(ssl)));
    }
    [[nodiscard]] auto add_socket_option(SocketOption option) const -> ConnectionProvider {
        return with_config(config_.add_socket_option(option));
    }
    [[nodiscard]] auto set_socket_options(std::vector<SocketOption> options) const -> ConnectionProvider {
        return with_config(config_.set_socket_options(std::move(options)));
    }
    [[nodiscard]] auto set_read_timeout(std::optional<std::chrono::milliseconds> timeout) const
        -> ConnectionProvider
    {
        return with_config(config_.set_read_timeout(timeout));
    }
    [[nodiscard]] auto set_allow_public_key_retrieval(bool allow) const -> ConnectionProvider {
        return with_config(config_.set_allow_public_key_retrieval(allow));
    }
    [[nodiscard]] auto set_database_term(DatabaseTerm term) const -> ConnectionProvider {
        return with_config(config_.set_database_term(term));
    }
    [[nodiscard]] auto set_tracer(std::shared_ptr<Tracer> tracer) const -> ConnectionProvider {
        return with_config(config_.set_tracer(std::move(tracer)));
    }
    [[nodiscard]] auto set_logger(std::shared_ptr<StructuredLogger> logger) const -> ConnectionProvider {
        return with_config(config_.set_logger(std::move(logger)));
    }

    // -----------------------------------------------------------------------
    // hook 설정
    //   with_before 는 hook 결과 타입이 바뀌므로 after 를 버린다.
    // -----------------------------------------------------------------------
    template <typename B>
    [[nodiscard]] auto with_before(
        std::function<boost::asio::awaitable<std::expected<B, Error>>(Connection&)> before) const
        -> ConnectionProvider<B>
    {
        using BeforeB = typename ConnectionProvider<B>::Before;
        return ConnectionProvider<B>(config_, std::make_shared<BeforeB>(std::move(before)), nullptr);
    }

    [[nodiscard]] auto with_after(After after) const -> ConnectionProvider {
        return ConnectionProvider(config_, before_, std::make_shared<After>(std::move(after)));
    }

    template <typename B>
    [[nodiscard]] auto with_before_after(
        std::function<boost::asio::awaitable<std::expected<B, Error>>(Connection&)>         before,
        std::function<boost::asio::awaitable<std::expected<void, Error>>(B&, Connection&)> after) const
        -> ConnectionProvider<B>
    {
        using BeforeB = typename ConnectionProvider<B>::Before;
        using AfterB  = typename ConnectionProvider<B>::After;
        return ConnectionProvider<B>(config_,
                                     std::make_shared<BeforeB>(std::move(before)),
                                     std::make_shared<AfterB>(std::move(after)));
    }

    // -----------------------------------------------------------------------
    // use
    // -----------------------------------------------------------------------
    template <typename T>
    auto use(std::function<boost::asio::awaitable<std::expected<T, Error>>(Connection&)> body) const
        -> boost::asio::awaitable<std::expected<T, Error>>
    {
        auto conn = co_await create_connection();
        if (!conn) {
            co_return std::unexpected(std::move(conn.error()));
        }
        co_return co_await run(**conn, std::move(body));
    }

    // transport 를 직접 넘기는 변형 (테스트 / 사용자 정의 transport)
    template <typename T>
    auto use(std::unique_ptr<Transport>                                                      transport,
             std::function<boost::asio::awaitable<std::expected<T, Error>>(Connection&)> body) const
        -> boost::asio::awaitable<std::expected<T, Error>>
    {
        auto conn = co_await Connection::open(std::move(transport), config_);
        if (!conn) {
            co_return std::unexpected(std::move(conn.error()));
        }
        co_return co_await run(**conn, std::move(body));
    }

    // 수명을 호출자가 관리하는 연결. hook 은 실행하지 않는다.
    auto create_connection() const
        -> boost::asio::awaitable<std::expected<std::unique_ptr<Connection>, Error>>
    {
        auto executor = co_await boost::asio::this_coro::executor;
        co_return co_await Connection::connect(executor, config_);
    }

    [[nodiscard]] auto config() const noexcept -> const ConnectionConfig& { return config_; }
    [[nodiscard]] auto before() const noexcept -> const std::shared_ptr<Before>& { return before_; }
    [[nodiscard]] auto after()  const noexcept -> const std::shared_ptr<After>& { return after_; }

    bool operator==(const ConnectionProvider&) const = default;

private:
    [[nodiscard]] auto with_config(ConnectionConfig config) const -> ConnectionProvider {
        return ConnectionProvider(std::move(config), before_, after_);
    }

    template <typename T>
    auto run(Connection&                                                                   conn,
             std::function<boost::asio::awaitable<std::expected<T, Error>>(Connection&)> body) const
        -> boost::asio::awaitable<std::expected<T, Error>>
    {
        std::optional<A> hook_value;
        if (before_ && *before_) {
            std::expected<A, Error> produced = std::unexpected(Error{ErrorCode::kUsage, "before hook failed"});
            std::exception_ptr      before_exception;
            try {
                produced = co_await (*before_)(conn);
            } catch (...) {
                before_exception = std::current_exception();
            }
            if (before_exception || !produced) {
                co_await conn.close();
                if (before_exception) {
                    std::rethrow_exception(before_exception);
                }
                co_return std::unexpected(std::move(produced.error()));
            }
            hook_value.emplace(std::move(*produced));
        } else if constexpr (std::is_default_constructible_v<A>) {
            hook_value.emplace();
        }

        std::optional<std::expected<T, Error>> result;
        std::exception_ptr                     body_exception;
        try {
            result.emplace(co_await body(conn));
        } catch (...) {
            body_exception = std::current_exception();
        }

        std::optional<Error> after_error;
        std::exception_ptr   after_exception;
        if (after_ && *after_ && hook_value) {
            try {
                auto done = co_await (*after_)(*hook_value, conn);
                if (!done) {
                    after_error = std::move(done.error());
                }
            } catch (...) {
                after_exception = std::current_exception();
            }
        }

        co_await conn.close();

        if (body_exception) {
            std::rethrow_exception(body_exception);
        }
        if (after_exception) {
            std::rethrow_exception(after_exception);
        }
        if (!*result) {
            co_return std::move(*result);
        }
        if (after_error) {
            co_return std::unexpected(std::move(*after_error));
        }
        co_return std::move(*result);
    }

    ConnectionConfig        config_{};
    std::shared_ptr<Before> before_{};
    std::shared_ptr<After>  after_{};
};
