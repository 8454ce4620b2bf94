/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation/upload.hpp>
#include <groundstation/celestrak.hpp>

#include <algorithm>
#include <list>
#include <sstream>
#include <thread>

#include <curlpp/cURLpp.hpp>
#include <curlpp/Easy.hpp>
#include <curlpp/Exception.hpp>
#include <curlpp/Form.hpp>
#include <curlpp/Infos.hpp>
#include <curlpp/Options.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

using spdlog::error;
using spdlog::info;
using spdlog::warn;

namespace fs = std::filesystem;

namespace groundstation {

constexpr long UPLOAD_TIMEOUT_SECONDS = 60;

bool uploadWithRetries(const std::function<UploadAttempt(int)> &attempt,
                       const RetryPolicy &policy,
                       const Sleeper &sleep) {
    int consecutiveNetworkErrors = 0;

    for (int n = 1; n <= policy.maxAttempts; n++) {
        info("Upload attempt #{} of {}", n, policy.maxAttempts);
        UploadAttempt result = attempt(n);

        if (result.success) {
            info("Upload completed successfully");
            return true;
        }
        error("Upload attempt #{} failed: {}", n, result.message);

        auto delay = policy.delay;
        if (result.networkError) {
            consecutiveNetworkErrors++;
            if (consecutiveNetworkErrors >= 2) {
                delay = policy.delay * std::min(consecutiveNetworkErrors, policy.maxBackoffFactor);
                warn("{} network errors in a row, waiting {} ms between attempts",
                     consecutiveNetworkErrors, delay.count());
            }
        } else {
            consecutiveNetworkErrors = 0;
            if (result.httpStatus >= 400 && result.httpStatus < 500) {
                error("Client error {}, not retrying", result.httpStatus);
                return false;
            }
        }

        if (n < policy.maxAttempts) {
            sleep(delay);
        }
    }

    error("Upload failed after {} attempts", policy.maxAttempts);
    return false;
}

HttpUploadClient::HttpUploadClient(std::string url, std::string authToken, RetryPolicy policy)
    : url(std::move(url)), authToken(std::move(authToken)), policy(policy) {}

bool HttpUploadClient::upload(const fs::path &file, const UploadMetadata &metadata) {
    if (!fs::exists(file)) {
        error("Cannot upload {}: file not found", file.string());
        return false;
    }
    info("Uploading {} to {}", file.string(), url);
    return uploadWithRetries(
        [&](int) { return attempt(file, metadata); },
        policy,
        [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); });
}

UploadAttempt HttpUploadClient::attempt(const fs::path &file, const UploadMetadata &metadata) {
    curlpp::Cleanup cleaner;
    curlpp::Easy request;

    // HttpPost copies the parts, the originals are freed here
    struct OwnedForm {
        curlpp::Forms parts;
        ~OwnedForm() {
            for (auto *part : parts) {
                delete part;
            }
        }
    } owned;
    curlpp::Forms &form = owned.parts;
    form.push_back(new curlpp::FormParts::File("wavfile", file.string()));
    form.push_back(new curlpp::FormParts::Content("myID", std::to_string(metadata.stationId)));
    form.push_back(new curlpp::FormParts::Content("satellite", metadata.satellite));
    form.push_back(new curlpp::FormParts::Content("locLat", fmt::format("{}", metadata.latitude)));
    form.push_back(new curlpp::FormParts::Content("locLon", fmt::format("{}", metadata.longitude)));
    form.push_back(new curlpp::FormParts::Content("gain", fmt::format("{}", metadata.gain)));
    form.push_back(new curlpp::FormParts::Content("timestamp", formatTimestamp(metadata.timestamp)));
    form.push_back(new curlpp::FormParts::Content("timezone", "UTC"));

    std::list<std::string> headers;
    headers.push_back("Authorization: Bearer " + authToken);

    std::ostringstream responseStream;

    request.setOpt(new curlpp::options::Url(url));
    request.setOpt(new curlpp::options::HttpPost(form));
    request.setOpt(new curlpp::options::HttpHeader(headers));
    request.setOpt(new curlpp::options::UserAgent("groundstation/1.0"));
    request.setOpt(new curlpp::options::Timeout(UPLOAD_TIMEOUT_SECONDS));
    request.setOpt(new curlpp::options::NoSignal(true));
    request.setOpt(new curlpp::options::WriteStream(&responseStream));

    UploadAttempt result;
    try {
        request.perform();
    } catch (curlpp::LibcurlRuntimeError &e) {
        result.networkError = isNetworkError(e.whatCode());
        result.message = e.what();
        return result;
    } catch (curlpp::RuntimeError &e) {
        result.message = e.what();
        return result;
    } catch (curlpp::LogicError &e) {
        result.message = e.what();
        return result;
    }

    result.httpStatus = curlpp::infos::ResponseCode::get(request);
    if (result.httpStatus >= 200 && result.httpStatus < 300) {
        result.success = true;
        result.message = responseStream.str();
    } else {
        result.message = fmt::format("Server error: {}", result.httpStatus);
    }
    return result;
}

}
