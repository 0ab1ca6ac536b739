#pragma once

#include <string>
#include <optional>

/**
 * Configuration for model_fetch.
 * Populated by CLI11 argument parser from command-line arguments and environment.
 */
struct FetchConfig
{
    // Global options
    std::string modelsRoot = "/workspace/ComfyUI/models";
    std::string civitaiToken;     // --civitai-token or CIVITAI_TOKEN
    std::string huggingFaceToken; // --hf-token or HF_TOKEN
    long timeoutSeconds = 60;     // connect timeout and max stall time
    int retryCount = 2;           // retries per batch item (3 attempts total)
    double retryDelaySeconds = 2.0;

    // get
    std::string url;
    std::string category = "checkpoints";
    std::optional<std::string> filename;

    // batch
    std::string batchFile = "-"; // "-" reads stdin
    std::string defaultCategory = "checkpoints";

    bool overwrite = false;
};
