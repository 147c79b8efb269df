/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "featloop/llama_agent.hpp"
#include "featloop/config.hpp"
#include "featloop/logger.hpp"
#include "llama.h"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <regex>
#include <stdexcept>
#include <vector>

namespace featloop {

std::shared_ptr<llama_model> LlamaAgent::shared_model_ = nullptr;
std::string LlamaAgent::current_model_path_ = "";
std::mutex LlamaAgent::model_mutex_;

namespace {
// Keeps llama.cpp chatter off the terminal unless LLAMA_LOG_LEVEL asks for it.
void filtered_llama_log(enum ggml_log_level level, const char* text, void* /*user_data*/) {
    if (!text || text[0] == '.' || text[0] == '\n' || text[0] == '\0') {
        return;
    }

    static int filter_level = -1;
    if (filter_level == -1) {
        const std::string env = envString("LLAMA_LOG_LEVEL", "error");
        filter_level = env == "info" ? GGML_LOG_LEVEL_INFO :
                       env == "warn" ? GGML_LOG_LEVEL_WARN :
                       env == "debug" ? GGML_LOG_LEVEL_DEBUG :
                       GGML_LOG_LEVEL_ERROR;
    }

    if (level >= filter_level) {
        std::fprintf(stderr, "%s", text);
    }
}

struct ContextDeleter {
    void operator()(llama_context* ctx) const noexcept { llama_free(ctx); }
};
struct SamplerDeleter {
    void operator()(llama_sampler* smpl) const noexcept { llama_sampler_free(smpl); }
};
}

std::string stripThinkBlocks(const std::string& text) {
    static const std::regex thinkRegex("<think>[\\s\\S]*?</think>\\s*");
    std::string result = std::regex_replace(text, thinkRegex, "");
    size_t start = result.find_first_not_of(" \t\n\r");
    return (start == std::string::npos) ? "" : result.substr(start);
}

LlamaAgent::LlamaAgent(const std::string& modelPath) {
    std::lock_guard<std::mutex> lock(model_mutex_);
    if (!shared_model_ || current_model_path_ != modelPath) {
        llama_log_set(filtered_llama_log, nullptr);
        ggml_backend_load_all();

        LOG_INFO("Loading model: " + modelPath);
        llama_model_params model_params = llama_model_default_params();
        #if defined(__APPLE__)
            model_params.n_gpu_layers = envInt("FEATLOOP_GPU_LAYERS", 99);
        #else
            model_params.n_gpu_layers = envInt("FEATLOOP_GPU_LAYERS", 0);
        #endif

        llama_model* model = llama_model_load_from_file(modelPath.c_str(), model_params);
        if (!model) {
            LOG_ERROR("Failed to load model: " + modelPath);
            throw std::runtime_error("Failed to load model: " + modelPath);
        }
        shared_model_ = std::shared_ptr<llama_model>(model, llama_model_free);
        current_model_path_ = modelPath;
        LOG_INFO("Model loaded successfully");
    }
    model_ = shared_model_;
}

LlamaAgent::SamplingConfig LlamaAgent::buildSamplingConfig() const {
    SamplingConfig config;
    const int n_ctx_train = llama_model_n_ctx_train(model_.get());

    config.temp = static_cast<float>(envDouble("FEATLOOP_TEMP", 0.8));
    config.top_k = envInt("FEATLOOP_TOP_K", 40);
    config.top_p = static_cast<float>(envDouble("FEATLOOP_TOP_P", 0.9));
    config.min_p = static_cast<float>(envDouble("FEATLOOP_MIN_P", 0.05));
    config.repeat_penalty = static_cast<float>(envDouble("FEATLOOP_REPEAT_PENALTY", 1.1));
    config.repeat_last_n = envInt("FEATLOOP_REPEAT_LAST_N", 64);
    config.seed = static_cast<uint32_t>(envInt("FEATLOOP_SEED", 0));

    config.max_ctx = std::min(n_ctx_train, envInt("FEATLOOP_MAX_CTX", 8192));
    config.n_predict = envInt("FEATLOOP_PREDICT", 2048);
    return config;
}

void LlamaAgent::buildContextParams(int n_prompt, const SamplingConfig& config, llama_context_params& params) const {
    params = llama_context_default_params();
    params.n_ctx = std::min(n_prompt + config.n_predict + 64, config.max_ctx);
    params.n_batch = envInt("FEATLOOP_BATCH", 2048);
    params.no_perf = true;
}

llama_sampler* LlamaAgent::buildSampler(const SamplingConfig& config) const {
    auto sparams = llama_sampler_chain_default_params();
    sparams.no_perf = true;
    llama_sampler* smpl = llama_sampler_chain_init(sparams);

    llama_sampler_chain_add(smpl, llama_sampler_init_penalties(config.repeat_last_n, config.repeat_penalty, 0.0f, 0.0f));
    llama_sampler_chain_add(smpl, llama_sampler_init_top_k(config.top_k));
    llama_sampler_chain_add(smpl, llama_sampler_init_top_p(config.top_p, 1));
    llama_sampler_chain_add(smpl, llama_sampler_init_min_p(config.min_p, 1));
    llama_sampler_chain_add(smpl, llama_sampler_init_temp(config.temp));
    llama_sampler_chain_add(smpl, llama_sampler_init_dist(config.seed));
    return smpl;
}

std::string LlamaAgent::formatPrompt(const std::vector<ChatTurn>& conversation) const {
    // Base models have no template and get the turns as plain text
    const char* tmpl = llama_model_chat_template(model_.get(), nullptr);
    if (!tmpl) {
        std::string text;
        for (const auto& turn : conversation) {
            text += turn.role + ": " + turn.content + "\n\n";
        }
        return text + "assistant: ";
    }

    std::vector<llama_chat_message> messages;
    messages.reserve(conversation.size());
    std::size_t total = 0;
    for (const auto& turn : conversation) {
        messages.push_back({turn.role.c_str(), turn.content.c_str()});
        total += turn.content.size();
    }

    std::vector<char> buf(total * 2 + 256);
    int len = llama_chat_apply_template(tmpl, messages.data(), messages.size(), true, buf.data(), buf.size());
    if (len < 0) {
        throw std::runtime_error("chat template could not be applied");
    }
    if (static_cast<std::size_t>(len) > buf.size()) {
        buf.resize(len);
        len = llama_chat_apply_template(tmpl, messages.data(), messages.size(), true, buf.data(), buf.size());
    }
    return std::string(buf.data(), len);
}

AgentReply LlamaAgent::invoke(const std::string& instruction,
                              const std::filesystem::path& workdir,
                              const ChildObserver& onWorker) {
    ToolLoopOptions options;
    options.maxSteps = envInt("FEATLOOP_AGENT_STEPS", 8);
    return runToolLoop(instruction, workdir,
                       [this](const std::vector<ChatTurn>& conversation) { return generate(conversation); },
                       onWorker, options);
}

AgentReply LlamaAgent::generate(const std::vector<ChatTurn>& conversation) {
    if (!model_) {
        return {false, "", "Model not loaded"};
    }

    try {
        SamplingConfig config = buildSamplingConfig();
        std::string formatted = formatPrompt(conversation);
        const llama_vocab* vocab = llama_model_get_vocab(model_.get());

        const int n_prompt = -llama_tokenize(vocab, formatted.c_str(), formatted.size(), nullptr, 0, true, true);
        if (n_prompt <= 0) {
            return {false, "", "Failed to tokenize instruction"};
        }
        config.n_predict = std::min(config.n_predict, std::max(0, config.max_ctx - n_prompt - 64));
        if (config.n_predict == 0) {
            return {false, "", "Instruction does not fit the context window"};
        }

        std::vector<llama_token> prompt_tokens(n_prompt);
        if (llama_tokenize(vocab, formatted.c_str(), formatted.size(), prompt_tokens.data(), prompt_tokens.size(), true, true) < 0) {
            return {false, "", "Failed to tokenize instruction"};
        }

        llama_context_params ctx_params;
        buildContextParams(n_prompt, config, ctx_params);
        std::unique_ptr<llama_context, ContextDeleter> ctx(llama_init_from_model(model_.get(), ctx_params));
        if (!ctx) {
            return {false, "", "Failed to create context"};
        }
        LOG_DEBUG("Context: " + std::to_string(ctx_params.n_ctx) + " tokens, prompt " + std::to_string(n_prompt));

        std::unique_ptr<llama_sampler, SamplerDeleter> smpl(buildSampler(config));
        llama_batch batch = llama_batch_get_one(prompt_tokens.data(), prompt_tokens.size());

        llama_token decoder_start_token_id = 0;
        if (llama_model_has_encoder(model_.get())) {
            if (llama_encode(ctx.get(), batch)) {
                return {false, "", "Failed to encode"};
            }
            decoder_start_token_id = llama_model_decoder_start_token(model_.get());
            if (decoder_start_token_id == LLAMA_TOKEN_NULL) {
                decoder_start_token_id = llama_vocab_bos(vocab);
            }
            batch = llama_batch_get_one(&decoder_start_token_id, 1);
        }

        std::string output;
        llama_token new_token_id;
        int n_pos = 0;

        for (; n_pos + batch.n_tokens < n_prompt + config.n_predict; ) {
            if (llama_decode(ctx.get(), batch)) {
                LOG_ERROR("Failed to decode");
                break;
            }
            n_pos += batch.n_tokens;

            new_token_id = llama_sampler_sample(smpl.get(), ctx.get(), -1);
            llama_sampler_accept(smpl.get(), new_token_id);
            if (llama_vocab_is_eog(vocab, new_token_id)) {
                break;
            }

            char buf[128];
            int n = llama_token_to_piece(vocab, new_token_id, buf, sizeof(buf), 0, true);
            if (n < 0) {
                LOG_ERROR("Failed to convert token to piece");
                break;
            }
            output.append(buf, n);
            batch = llama_batch_get_one(&new_token_id, 1);
        }

        LOG_INFO("Generated " + std::to_string(output.size()) + " bytes");
        return {true, stripThinkBlocks(output), ""};

    } catch (const std::exception& e) {
        LOG_ERROR("Inference error: " + std::string(e.what()));
        return {false, "", "Inference error: " + std::string(e.what())};
    }
}

}
