#include "core/onnx_model.h"
#include "utils/logger.h"
#include <algorithm>
#ifdef _WIN32
#include <Windows.h>
#endif

namespace vc {

namespace {

std::string shape_to_string(const std::vector<int64_t>& shape) {
    std::string s = "[";
    for (size_t j = 0; j < shape.size(); ++j) {
        if (j > 0) s += ", ";
        s += std::to_string(shape[j]);
    }
    return s + "]";
}

} // anonymous namespace

OnnxModel::OnnxModel() = default;
OnnxModel::~OnnxModel() = default;

bool OnnxModel::load(const std::string& model_path, Ort::Env& env, int num_threads) {
    try {
        session_options_.SetIntraOpNumThreads(num_threads);
        session_options_.SetInterOpNumThreads(1);
        session_options_.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

#ifdef _WIN32
        // Convert to wide string for Windows (UTF-8 safe)
        int wlen = MultiByteToWideChar(CP_UTF8, 0, model_path.c_str(), -1, nullptr, 0);
        std::wstring wpath(wlen, 0);
        MultiByteToWideChar(CP_UTF8, 0, model_path.c_str(), -1, &wpath[0], wlen);
        session_ = std::make_unique<Ort::Session>(env, wpath.c_str(), session_options_);
#else
        session_ = std::make_unique<Ort::Session>(env, model_path.c_str(), session_options_);
#endif

        input_names_.clear();
        for (size_t i = 0; i < session_->GetInputCount(); ++i) {
            auto name = session_->GetInputNameAllocated(i, allocator_);
            input_names_.push_back(name.get());
        }

        output_names_.clear();
        for (size_t i = 0; i < session_->GetOutputCount(); ++i) {
            auto name = session_->GetOutputNameAllocated(i, allocator_);
            output_names_.push_back(name.get());
        }

        // Cache custom metadata so lookups need no allocator later
        metadata_.clear();
        Ort::ModelMetadata meta = session_->GetModelMetadata();
        auto keys = meta.GetCustomMetadataMapKeysAllocated(allocator_);
        for (auto& key : keys) {
            auto value = meta.LookupCustomMetadataMapAllocated(key.get(), allocator_);
            if (value) {
                metadata_.emplace_back(key.get(), value.get());
            }
        }

        loaded_ = true;
        path_ = model_path;
        VC_LOG_INFO("ONNX model loaded: {} (inputs={}, outputs={}, metadata={})",
                    model_path, input_names_.size(), output_names_.size(), metadata_.size());

        for (size_t i = 0; i < input_names_.size(); ++i) {
            VC_LOG_DEBUG("  Input {}: {} shape={}", i, input_names_[i],
                         shape_to_string(input_dims(i)));
        }
        for (size_t i = 0; i < output_names_.size(); ++i) {
            VC_LOG_DEBUG("  Output {}: {} shape={}", i, output_names_[i],
                         shape_to_string(output_dims(i)));
        }

        return true;
    } catch (const Ort::Exception& e) {
        last_error_ = std::string("ONNX load error: ") + e.what();
        VC_LOG_ERROR(last_error_);
        session_.reset();
        loaded_ = false;
        return false;
    }
}

bool OnnxModel::run(const std::vector<float>& input, const std::vector<int64_t>& input_shape,
                    std::vector<std::vector<float>>& outputs, std::string* error) const {
    if (!loaded_) {
        if (error) *error = "Model not loaded";
        return false;
    }

    try {
        Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
            memory_info_, const_cast<float*>(input.data()), input.size(),
            input_shape.data(), input_shape.size());

        const char* input_name = input_names_[0].c_str();
        std::vector<const char*> output_names;
        for (const auto& name : output_names_) output_names.push_back(name.c_str());

        auto values = session_->Run(Ort::RunOptions{nullptr},
                                    &input_name, &input_tensor, 1,
                                    output_names.data(), output_names.size());

        outputs.clear();
        for (auto& value : values) {
            auto type_info = value.GetTensorTypeAndShapeInfo();
            size_t count = type_info.GetElementCount();
            const float* data = value.GetTensorData<float>();
            outputs.emplace_back(data, data + count);
        }
        return true;
    } catch (const Ort::Exception& e) {
        if (error) *error = std::string("ONNX inference error: ") + e.what();
        VC_LOG_ERROR("ONNX inference error ({}): {}", path_, e.what());
        return false;
    }
}

bool OnnxModel::metadata(const std::string& key, std::string& value) const {
    for (const auto& entry : metadata_) {
        if (entry.first == key) {
            value = entry.second;
            return true;
        }
    }
    return false;
}

std::vector<int64_t> OnnxModel::input_dims(size_t index) const {
    return session_->GetInputTypeInfo(index).GetTensorTypeAndShapeInfo().GetShape();
}

std::vector<int64_t> OnnxModel::output_dims(size_t index) const {
    return session_->GetOutputTypeInfo(index).GetTensorTypeAndShapeInfo().GetShape();
}

} // namespace vc
