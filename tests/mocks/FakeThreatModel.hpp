/*
 * Copyright (c) 2025-present
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 * The Sentinet Authors and Contributors
 */

#pragma once
#include "sentinet_core/security/ThreatModel.hpp"
#include <stdexcept>

/**
 * @brief ThreatModel returning fixed signals, or throwing when told to.
 */
class FakeThreatModel : public ThreatModel
{
  public:
    std::optional<ModelSignals> infer(double, double, double) override
    {
        ++calls;
        if (throwOnInfer)
        {
            throw std::runtime_error("model inference failed");
        }
        return signals;
    }

    std::optional<ModelSignals> signals;
    bool throwOnInfer = false;
    int calls = 0;
};
