//
//  text_generator.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include "cancellation.hpp"

namespace subforge {

/**
 * @brief The external text-generation capability driven by the optimizer.
 *
 * generate() blocks the calling thread until the provider answers, fails, or `cancel`
 * fires. On failure it returns false and fills `error` with the provider's message;
 * the optimizer classifies authentication failures by that wording.
 */
class TextGenerator {
   public:
    virtual ~TextGenerator() = default;

    virtual bool generate(const std::string &api_key, const std::string &prompt,
                          const CancellationToken &cancel, std::string &response,
                          std::string &error) = 0;
};

}  // namespace subforge
