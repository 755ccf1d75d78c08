#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>

// Best-path CTC：逐帧 argmax -> 合并连续重复 -> 去 blank -> 查字典
// probs: T x C CV_32F；charset 覆盖全部 C 个类别（blank 那一项不会被输出）
// avg_conf 为输出字符概率的几何平均，没有输出时为 0
std::string ctc_greedy_decode(const cv::Mat &probs, const std::vector<std::string> &charset, int blank_index,
                              float *avg_conf = nullptr);
