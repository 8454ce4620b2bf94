/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation/celestrak.hpp>

#include <curl/curl.h>
#include <curlpp/cURLpp.hpp>
#include <curlpp/Easy.hpp>
#include <curlpp/Exception.hpp>
#include <curlpp/Options.hpp>
#include <spdlog/spdlog.h>

#include <sstream>

using spdlog::debug;
using spdlog::info;

namespace groundstation {

bool isNetworkError(int curlCode) {
    switch (static_cast<CURLcode>(curlCode)) {
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
            return true;
        default:
            return false;
    }
}

std::string CelestrakSource::fetch() {
    curlpp::Cleanup cleaner;
    curlpp::Easy request;

    debug("Downloading TLE data from {}", url);

    request.setOpt(new curlpp::options::Url(url));
    request.setOpt(new curlpp::options::FollowLocation(true));
    request.setOpt(new curlpp::options::FailOnError(true));
    request.setOpt(new curlpp::options::Timeout(static_cast<long>(timeout.count())));
    request.setOpt(new curlpp::options::ConnectTimeout(static_cast<long>(timeout.count())));
    request.setOpt(new curlpp::options::NoSignal(true));

    std::ostringstream responseStream;
    request.setOpt(new curlpp::options::WriteStream(&responseStream));

    try {
        request.perform();
    } catch (curlpp::LibcurlRuntimeError &e) {
        if (isNetworkError(e.whatCode())) {
            throw NetworkException(std::string("Network error downloading TLE data: ") + e.what());
        }
        throw std::runtime_error(std::string("TLE download failed: ") + e.what());
    } catch (curlpp::RuntimeError &e) {
        throw std::runtime_error(std::string("TLE download failed: ") + e.what());
    } catch (curlpp::LogicError &e) {
        throw std::runtime_error(std::string("HTTP logic error: ") + e.what());
    }

    std::string response = responseStream.str();
    info("Downloaded {} bytes of TLE data", response.size());

    // Celestrak answers unknown groups with a plain text message
    if (response.find("No GP data found") != std::string::npos) {
        throw std::runtime_error("Celestrak error: No GP data found at " + url);
    }

    return response;
}

}
