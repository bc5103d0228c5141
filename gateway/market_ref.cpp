#include "market_ref.H"

#include <cstdio>
#include <sstream>
#include <vector>

namespace predex::gateway {

static std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

static bool has_scheme(const std::string& ref) {
    return ref.rfind("http://", 0) == 0 || ref.rfind("https://", 0) == 0;
}

MarketRef parse_market_ref(const std::string& ref) {
    MarketRef result;
    if (ref.empty()) {
        return result;
    }

    if (!has_scheme(ref) && ref.find("polymarket.com") == std::string::npos) {
        if (ref.find_first_of("/ ?#") == std::string::npos) {
            result.type = REF_TYPE::ID;
            result.value = ref;
        }
        return result;
    }

    std::string rest = ref;
    auto scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        rest = rest.substr(scheme_end + 3);
    }

    auto path_start = rest.find('/');
    std::string host = rest.substr(0, path_start);
    if (host.find("polymarket.com") == std::string::npos || path_start == std::string::npos) {
        return result;
    }
    std::string path = rest.substr(path_start);

    std::string query;
    auto fragment = path.find('#');
    if (fragment != std::string::npos) {
        path = path.substr(0, fragment);
    }
    auto query_start = path.find('?');
    if (query_start != std::string::npos) {
        query = path.substr(query_start + 1);
        path = path.substr(0, query_start);
    }

    auto parts = split_path(path);
    if (parts.size() < 2) {
        return result;
    }
    if (parts[0] == "event") {
        result.type = REF_TYPE::EVENT;
    } else if (parts[0] == "market") {
        result.type = REF_TYPE::MARKET;
    } else {
        return result;
    }
    result.value = parts[1];

    std::stringstream qs(query);
    std::string param;
    while (std::getline(qs, param, '&')) {
        if (param.rfind("tid=", 0) == 0) {
            result.tid = param.substr(4);
        }
    }
    return result;
}

bool is_market_url(const std::string& ref) {
    auto parsed = parse_market_ref(ref);
    return parsed.type == REF_TYPE::EVENT || parsed.type == REF_TYPE::MARKET;
}

std::string format_market_summary(const Market& market) {
    char prices[128];
    snprintf(prices, sizeof(prices), "YES %.4f (%.1f%%)  NO %.4f (%.1f%%)",
             market.price_yes, market.price_yes * 100, market.price_no, market.price_no * 100);

    char depth[128];
    snprintf(depth, sizeof(depth), "Volume $%.2f  Liquidity $%.2f", market.volume, market.liquidity);

    std::ostringstream out;
    out << "Market: " << market.question << "\n"
        << "ID: " << market.id << "  Slug: " << market.slug << "\n"
        << "Condition ID: " << market.condition_id << "\n"
        << prices << "\n"
        << depth << "\n"
        << "Token YES: " << market.token_id_yes << "\n"
        << "Token NO: " << market.token_id_no << "\n"
        << "Status: " << to_string(market.status);
    return out.str();
}

} // namespace predex::gateway
