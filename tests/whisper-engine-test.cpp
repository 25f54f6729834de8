// whisper-engine-test.cpp - whisper.cpp Backend Tests (no model needed)

// stl includes
#include <fstream>
#include <string>

// lib includes
#include <boost/filesystem.hpp>
#include <gtest/gtest.h>
#include <whisperserve/whisper-engine.hpp>

using namespace whisperserve;
namespace fs = boost::filesystem;


class ModelPathTest : public ::testing::Test {
  protected:
    ModelPathTest() {
        dir_ = fs::temp_directory_path() / fs::unique_path("whisperserve-models-%%%%-%%%%");
        fs::create_directories(dir_);
    }

    ~ModelPathTest() {
        boost::system::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void touch(const std::string &name) {
        std::ofstream file((dir_ / name).string());
        file << "ggml";
    }

    ModelConfig model(const std::string &size, const std::string &compute_type) {
        ModelConfig model;
        model.size = size;
        model.download_dir = dir_.string();
        model.device = Device::CPU;
        model.compute_type = compute_type;
        return model;
    }

    fs::path dir_;
};


TEST_F(ModelPathTest, SizeMapsToGgmlFile) {
    EXPECT_EQ(resolve_model_path(model("large-v3", "float16")), (dir_ / "ggml-large-v3.bin").string());
}

TEST_F(ModelPathTest, Int8PrefersQuantizedFileWhenPresent) {
    EXPECT_EQ(resolve_model_path(model("small", "int8")), (dir_ / "ggml-small.bin").string());

    touch("ggml-small-q8_0.bin");
    EXPECT_EQ(resolve_model_path(model("small", "int8")), (dir_ / "ggml-small-q8_0.bin").string());
    EXPECT_EQ(resolve_model_path(model("small", "int8_float16")), (dir_ / "ggml-small-q8_0.bin").string());
    EXPECT_EQ(resolve_model_path(model("small", "float16")), (dir_ / "ggml-small.bin").string());
}

TEST_F(ModelPathTest, ExistingFileIsUsedAsIs) {
    touch("custom.bin");
    const std::string custom = (dir_ / "custom.bin").string();

    EXPECT_EQ(resolve_model_path(model(custom, "int8")), custom);
}

TEST_F(ModelPathTest, MissingModelFailsToLoad) {
    ResolvedConfig config;
    config.model = model("tiny", "int8");
    config.inference.vad_filter = false;
    config.concurrency.num_workers = 1;
    config.concurrency.cpu_threads = 1;

    EXPECT_THROW(WhisperEngine engine(config), std::runtime_error);
}
