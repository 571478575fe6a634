#ifndef VC_ONNX_MODEL_H
#define VC_ONNX_MODEL_H

#include <string>
#include <vector>
#include <memory>
#include <onnxruntime_cxx_api.h>

namespace vc {

class OnnxModel {
public:
    OnnxModel();
    ~OnnxModel();

    // Load model from file
    bool load(const std::string& model_path, Ort::Env& env, int num_threads = 2);

    // Run inference on the first input and collect every float output.
    // Safe to call concurrently once loaded.
    bool run(const std::vector<float>& input, const std::vector<int64_t>& input_shape,
             std::vector<std::vector<float>>& outputs, std::string* error = nullptr) const;

    // Value of a custom metadata entry written at export time
    bool metadata(const std::string& key, std::string& value) const;

    bool is_loaded() const { return loaded_; }
    const std::string& last_error() const { return last_error_; }

private:
    std::vector<int64_t> input_dims(size_t index) const;
    std::vector<int64_t> output_dims(size_t index) const;

    std::unique_ptr<Ort::Session> session_;
    Ort::SessionOptions session_options_;
    Ort::MemoryInfo memory_info_ = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
    Ort::AllocatorWithDefaultOptions allocator_;

    std::vector<std::string> input_names_;
    std::vector<std::string> output_names_;
    std::vector<std::pair<std::string, std::string>> metadata_;

    bool loaded_ = false;
    std::string path_;
    std::string last_error_;
};

} // namespace vc

#endif // VC_ONNX_MODEL_H
