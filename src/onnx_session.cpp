#include "onnx_session.h"
#include <iostream>
#include <stdexcept>

Ort::Env &OrtEnvHolder::Get() {
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "ctpn_ocr");
    return env;
}

static Ort::SessionOptions make_options(bool use_cuda, int intra_threads) {
    Ort::SessionOptions opt;
    opt.SetIntraOpNumThreads(intra_threads);
    opt.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
    if (use_cuda) {
        try {
            OrtCUDAProviderOptions cuda_opts{};
            opt.AppendExecutionProvider_CUDA(cuda_opts);
        } catch (const Ort::Exception &e) {
            // 没有 CUDA EP 的构建，退回 CPU
            std::cerr << "[WARN] CUDA provider unavailable (" << e.what() << "), running on CPU\n";
        }
    }
    return opt;
}

OnnxSession::OnnxSession(const std::string &model_path, bool use_cuda, int intra_threads) {
    Ort::SessionOptions opt = make_options(use_cuda, intra_threads);
#ifdef _WIN32
    std::wstring wpath(model_path.begin(), model_path.end());
    session_ = Ort::Session(OrtEnvHolder::Get(), wpath.c_str(), opt);
#else
    session_ = Ort::Session(OrtEnvHolder::Get(), model_path.c_str(), opt);
#endif

    if (session_.GetInputCount() != 1)
        throw std::runtime_error(model_path + ": expected a single-input model, got " +
                                 std::to_string(session_.GetInputCount()) + " inputs");

    Ort::AllocatorWithDefaultOptions allocator;
    input_name_ = session_.GetInputNameAllocated(0, allocator).get();
    input_shape_ = session_.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
    for (auto &d: input_shape_) {
        if (d == 0) d = -1;
    }

    const size_t out_cnt = session_.GetOutputCount();
    output_names_.reserve(out_cnt);
    for (size_t i = 0; i < out_cnt; ++i)
        output_names_.emplace_back(session_.GetOutputNameAllocated(i, allocator).get());

#ifndef NDEBUG
    std::cout << "[ORT] " << model_path << " input=" << input_name_ << " outputs=" << out_cnt << "\n";
#endif
}

std::vector<Ort::Value> OnnxSession::run(Ort::Value &input) const {
    const char *in = input_name_.c_str();
    std::vector<const char *> out;
    out.reserve(output_names_.size());
    for (auto &nm: output_names_)
        out.push_back(nm.c_str());
    return session_.Run(Ort::RunOptions{nullptr}, &in, &input, 1, out.data(), out.size());
}
