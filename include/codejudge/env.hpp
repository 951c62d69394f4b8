#pragma once

namespace codejudge {

/**
 * @brief 从环境变量读取配置，写入 config.hpp 中的全局变量
 * 没有设置的环境变量保持默认值；无法解析的数值记录警告后也保持默认值。
 * 命令行参数的优先级更高，因此 main 在调用本函数后再处理命令行参数。
 */
void load_environment();

}  // namespace codejudge
