#pragma once

#include <filesystem>

namespace grader {

/**
 * @brief 单次评测尝试的工作目录，由各个子命令共享
 * @defaultValue /tmp/work，可以通过环境变量 WORKDIR 或 --work-dir 指定
 *
 * WORK_DIR
 * ├── tid // 任务 id，只读
 * ├── input
 * │   └── data.csv // 测试数据集，写入后只读
 * ├── output
 * │   ├── data.res // 学生程序的运行结果（unit）
 * │   ├── solution.res // 标准程序的运行结果（unit）
 * │   ├── out.err // 学生程序的 runner 崩溃时的诊断信息（unit）
 * │   └── res.json // 学生程序的运行结果（io）
 * ├── student // 已经填充好的学生程序
 * └── teacher // 已经填充好的标准程序
 */
extern std::filesystem::path WORK_DIR;

/**
 * @brief 题目目录，config/test.json 为题目的测试配置
 * @defaultValue /task，可以通过环境变量 TASKDIR 或 --task-dir 指定
 */
extern std::filesystem::path TASK_DIR;

/**
 * @brief 单次运行外部程序的墙钟时间限制，单位为秒，0 表示不限制
 */
extern int TIME_LIMIT;

/**
 * @brief 是否是调试模式
 * 调试模式下出错时会输出完整的调用栈
 */
extern bool DEBUG;

}  // namespace grader
