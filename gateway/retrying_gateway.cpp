#include "retrying_gateway.H"

#include <exception>
#include <stdexcept>

namespace predex::gateway {

static std::optional<std::chrono::milliseconds> parse_retry_after(const HttpResponse& response) {
    auto it = response.headers.find("retry-after");
    if (it == response.headers.end()) {
        return std::nullopt;
    }
    try {
        double seconds = std::stod(it->second);
        if (seconds < 0) {
            return std::nullopt;
        }
        return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000));
    } catch (const std::exception&) {
        // HTTP-date form is not used by the venue
        return std::nullopt;
    }
}

RetryingGateway::RetryingGateway(HttpTransport& transport, RateLimiter& limiter, const RetryConfig& config,
                                 std::shared_ptr<spdlog::logger> logger)
    : transport(transport), limiter(limiter), config(config),
      backoff(config.base_delay, config.max_delay, config.jitter), logger(logger) {
    if (config.max_attempts < 1) {
        throw std::invalid_argument("RetryingGateway needs at least one attempt");
    }
}

nlohmann::json RetryingGateway::attempt(const HttpRequest& request, const ResponseSchema& schema) {
    attempt_count++;
    HttpResponse response = transport.perform(request, config.timeout);

    if (response.status < 200 || response.status >= 300) {
        std::string snippet = response.body.substr(0, 256);
        throw GatewayError(classify_status(response.status),
                           request.method + " " + request.url + " returned " + std::to_string(response.status) +
                           ": " + snippet,
                           response.status, parse_retry_after(response));
    }

    nlohmann::json body;
    if (!response.body.empty()) {
        try {
            body = nlohmann::json::parse(response.body);
        } catch (const nlohmann::json::parse_error& e) {
            throw SchemaViolation(std::string("response is not JSON: ") + e.what());
        }
    }
    schema.validate(body);
    return body;
}

nlohmann::json RetryingGateway::call(const HttpRequest& request, const ResponseSchema& schema, const StopToken& stop,
                                     double weight) {
    std::exception_ptr last_error;

    for (uint32_t attempt_no = 0; attempt_no < config.max_attempts; ++attempt_no) {
        if (stop.stop_requested()) {
            throw GatewayError(GATEWAY_ERROR::CANCELLED, request.method + " " + request.url + " cancelled");
        }

        limiter.acquire(weight, stop);

        try {
            return attempt(request, schema);
        } catch (const GatewayError& e) {
            if (!e.is_retryable()) {
                logger->warn("{} {} failed with {}: {}", request.method, request.url, to_string(e.get_kind()), e.what());
                throw;
            }
            last_error = std::current_exception();

            if (attempt_no + 1 >= config.max_attempts) {
                logger->error("{} {} failed after {} attempts: {}", request.method, request.url,
                              config.max_attempts, e.what());
                break;
            }

            auto delay = backoff.delay(attempt_no);
            auto hint = e.get_retry_after();
            if (hint && *hint > delay) {
                delay = *hint;
            }

            logger->warn("{} {} attempt {}/{} failed with {}, retrying in {}ms", request.method, request.url,
                         attempt_no + 1, config.max_attempts, to_string(e.get_kind()), delay.count());

            if (stop.wait_for(delay)) {
                throw GatewayError(GATEWAY_ERROR::CANCELLED, request.method + " " + request.url + " cancelled");
            }
        }
    }

    std::rethrow_exception(last_error);
}

nlohmann::json RetryingGateway::call(const HttpRequest& request, const ResponseSchema& schema) {
    return call(request, schema, StopToken());
}

} // namespace predex::gateway
