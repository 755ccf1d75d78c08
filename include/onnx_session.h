#pragma once
#include <onnxruntime_cxx_api.h>
#include <string>
#include <vector>

// 进程内共用一个 Ort::Env
class OrtEnvHolder {
public:
    static Ort::Env& Get();
};

// 单输入模型：构造时读出输入形状和全部输出名，run() 一次取回所有输出
class OnnxSession {
public:
    explicit OnnxSession(const std::string& model_path, bool use_cuda=false, int intra_threads=4);

    size_t output_count() const { return output_names_.size(); }
    // 动态维为 -1
    const std::vector<int64_t>& input_shape() const { return input_shape_; }

    std::vector<Ort::Value> run(Ort::Value& input) const;

private:
    mutable Ort::Session session_{nullptr};
    std::string input_name_;
    std::vector<std::string> output_names_;
    std::vector<int64_t> input_shape_;
};
