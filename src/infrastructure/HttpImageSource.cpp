#include "infrastructure/HttpImageSource.hpp"
#include <httplib.h>
#include <iostream>

namespace chronolens::infrastructure {

namespace {

std::optional<std::string> HeaderValue(const httplib::Response& res, const char* name) {
    if (!res.has_header(name)) return std::nullopt;
    std::string value = res.get_header_value(name);
    if (value.empty()) return std::nullopt;
    return value;
}

} // namespace

HttpImageSource::HttpImageSource(const domain::SourceConfig& config)
    : m_name(config.name),
      m_host(config.host),
      m_port(config.port),
      m_path(config.path.empty() ? "/" : config.path),
      m_timeoutMs(config.timeoutMs) {}

std::optional<domain::FetchedImage> HttpImageSource::fetch(const std::string& searchTerm, std::optional<int> year) {
    if (m_host.empty()) {
        std::cerr << "[HttpImageSource] " << m_name << " has no endpoint configured" << std::endl;
        return std::nullopt;
    }

    httplib::Client cli(m_host, m_port);
    time_t seconds = m_timeoutMs / 1000;
    time_t micros = (m_timeoutMs % 1000) * 1000;
    cli.set_connection_timeout(seconds, micros);
    cli.set_read_timeout(seconds, micros);

    httplib::Params params{{"q", searchTerm}, {"source", m_name}};
    if (year) {
        params.emplace("year", std::to_string(*year));
    }

    auto res = cli.Get(m_path, params, httplib::Headers{});
    if (!res) {
        std::cerr << "[HttpImageSource] " << m_name << " connection failed: "
                  << httplib::to_string(res.error()) << std::endl;
        return std::nullopt;
    }
    if (res->status != 200) {
        if (res->status != 404) {
            std::cerr << "[HttpImageSource] " << m_name << " HTTP Error " << res->status << std::endl;
        }
        return std::nullopt;
    }
    if (res->body.empty()) {
        return std::nullopt;
    }

    domain::FetchedImage image;
    image.bytes.assign(res->body.begin(), res->body.end());
    image.metadata.searchTerm = searchTerm;
    image.metadata.title = HeaderValue(*res, "X-Image-Title");
    image.metadata.url = HeaderValue(*res, "X-Image-Url");
    image.metadata.date = HeaderValue(*res, "X-Image-Date");
    return image;
}

} // namespace chronolens::infrastructure
