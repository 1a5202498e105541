#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 单次评测尝试的工作目录，布局见 config.hpp 中的 WORK_DIR
 * 各个子命令可能是不同的进程，它们只通过工作目录中固定的相对路径交换数据。
 */
struct workspace {
    explicit workspace(std::filesystem::path root);

    std::filesystem::path root;

    std::filesystem::path tid_file() const;
    std::filesystem::path dataset_file() const;
    std::filesystem::path submission_outcomes_file() const;
    std::filesystem::path reference_outcomes_file() const;
    std::filesystem::path runner_error_file() const;
    std::filesystem::path results_file() const;
    std::filesystem::path fields_file() const;
    std::filesystem::path actor_dir(const std::string &actor) const;

    /**
     * @brief 清空工作目录并重新创建 input、output、student、teacher 目录
     */
    void reset() const;

    /**
     * @brief 写入任务 id，只允许写入一次
     */
    void write_tid(const std::string &tid) const;

    /**
     * @brief 读取任务 id
     * @throw data_error 工作目录还没有经过 preprocess
     */
    std::string tid() const;
};

}  // namespace grader
