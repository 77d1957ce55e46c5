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
#include <optional>
#include <string>

/**
 * @brief Raw output of the external classification models for one flow.
 *
 * anomaly is the unsupervised detector's verdict; attackClass is the supervised
 * classifier's label ("Normal" for benign traffic); confidence is its highest class
 * probability.
 */
struct ModelSignals
{
    bool anomaly = false;
    std::string attackClass = "Normal";
    double confidence = 0.0;
};

/**
 * @brief Classification capability backed by trained model artifacts.
 */
class ThreatModel
{
  public:
    virtual ~ThreatModel() = default;

    /**
     * @return std::nullopt when the models are not loaded. May throw on inference failure.
     */
    virtual std::optional<ModelSignals> infer(double pps, double bps, double avgPktSize) = 0;
};

/**
 * @brief ThreatModel with no artifacts; the detector always falls back to thresholds.
 */
class NullThreatModel : public ThreatModel
{
  public:
    std::optional<ModelSignals> infer(double, double, double) override
    {
        return std::nullopt;
    }
};
