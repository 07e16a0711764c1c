//
//  gemini_client.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include "text_generator.hpp"

namespace subforge {

inline constexpr const char *kDefaultGeminiModel = "gemini-2.0-flash";
inline constexpr const char *kDefaultGeminiEndpoint = "https://generativelanguage.googleapis.com";
inline constexpr long kDefaultGeminiTimeoutSeconds = 120;

struct GeminiSettings {
    std::string model = kDefaultGeminiModel;
    std::string endpoint = kDefaultGeminiEndpoint;  ///< scheme + host, no trailing path
    long timeout_seconds = kDefaultGeminiTimeoutSeconds;
};

/**
 * @brief TextGenerator backed by the Gemini generateContent REST call (libcurl).
 *
 * One blocking POST per generate(); the transfer is aborted from the progress callback
 * as soon as the cancellation token fires. HTTP 401/403 and provider messages about the
 * key are reported with "authentication" wording so the optimizer can classify them.
 */
class GeminiClient : public TextGenerator {
   public:
    explicit GeminiClient(GeminiSettings settings = {});

    bool generate(const std::string &api_key, const std::string &prompt,
                  const CancellationToken &cancel, std::string &response,
                  std::string &error) override;

    const GeminiSettings &settings() const { return settings_; }

   private:
    GeminiSettings settings_;
};

// "{endpoint}/v1beta/models/{model}:generateContent"
std::string gemini_request_url(const GeminiSettings &settings);

// {"contents":[{"parts":[{"text": prompt}]}]}
std::string gemini_request_body(const std::string &prompt);

// Pull candidates[0].content.parts[*].text out of a generateContent reply, or the
// provider's error.message. Returns false with `error` filled on failure.
bool gemini_extract_text(long http_status, const std::string &body, std::string &text,
                         std::string &error);

}  // namespace subforge
