/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "featloop/agent.hpp"
#include "featloop/tool_loop.hpp"

struct llama_model;
struct llama_context_params;
struct llama_sampler;

namespace featloop {

// Coding agent backed by a local GGUF model through llama.cpp. The model is
// loaded once and shared by every instance; each invocation gets its own
// context, so instances may run concurrently from pool workers.
//
// The model only answers in text; it acts on the working copy through the
// shell commands runToolLoop executes for it, and its replies are scanned for
// completion tokens like any other agent's output.
class LlamaAgent final : public CodingAgent {
public:
    explicit LlamaAgent(const std::string& modelPath);
    ~LlamaAgent() override = default;

    LlamaAgent(const LlamaAgent&) = delete;
    LlamaAgent& operator=(const LlamaAgent&) = delete;

    [[nodiscard]] AgentReply invoke(const std::string& instruction,
                                    const std::filesystem::path& workdir,
                                    const ChildObserver& onWorker = {}) override;

    [[nodiscard]] std::string name() const override { return "llama.cpp"; }

private:
    struct SamplingConfig {
        int n_predict = 0;
        int max_ctx = 0;
        float temp = 0.8f;
        int top_k = 40;
        float top_p = 0.9f;
        float min_p = 0.05f;
        float repeat_penalty = 1.1f;
        int repeat_last_n = 64;
        uint32_t seed = 0;
    };

    static std::shared_ptr<llama_model> shared_model_;
    static std::string current_model_path_;
    static std::mutex model_mutex_;

    std::shared_ptr<llama_model> model_;

    std::string formatPrompt(const std::vector<ChatTurn>& conversation) const;
    SamplingConfig buildSamplingConfig() const;
    void buildContextParams(int n_prompt, const SamplingConfig& config, llama_context_params& params) const;
    llama_sampler* buildSampler(const SamplingConfig& config) const;
    AgentReply generate(const std::vector<ChatTurn>& conversation);
};

// Removes <think>...</think> blocks emitted by reasoning models.
std::string stripThinkBlocks(const std::string& text);

}
