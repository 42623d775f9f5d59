#include <cstring>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "voice_api.hpp"

void printUsage(const char* program) {
    std::cout << "用法: " << program << " [选项]\n"
        << "\n"
        << "选项:\n"
        << "  -p <text>        直接合成指定文本\n"
        << "  -l <engine>      引擎选择: tone (默认) 或 http:<endpoint>\n"
        << "  -v <preset>      基础预设 (默认: professional_male)\n"
        << "  --pitch <st>     覆盖音高 (半音)\n"
        << "  --overrides <j>  覆盖字段 (JSON 对象), 如 {\"speed\":1.1}\n"
        << "  -e <emotion>     情绪\n"
        << "  -i <intensity>   情绪强度 [0, 1] (默认: 1.0)\n"
        << "  -f <effect>      效果 (可重复, 按顺序应用), 如 reverb:room_size=0.6\n"
        << "  -t <transform>   变声预设, 与 --in 一起使用\n"
        << "  --in <file>      输入音频文件 (处理模式)\n"
        << "  --store <dir>    档案目录 (默认使用内存存储)\n"
        << "  -o <file>        输出文件 (默认: output.wav)\n"
        << "  --list           列出预设、情绪、效果与变声预设\n"
        << "  -h               显示帮助\n"
        << "\n"
        << "交互模式:\n"
        << "  不带 -p 与 --in 时进入交互模式，输入文本后按 Enter 合成\n"
        << "  输入 'q' 或 'quit' 退出\n"
        << "\n"
        << "示例:\n"
        << "  " << program << " -p \"Hello\" -v narrator_deep -e calm\n"
        << "  " << program << " -p \"Good news\" -e happy -i 0.5 -f equalizer:bass=3 -f reverb\n"
        << "  " << program << " --in voice.wav -t robot -o robot.wav\n"
        << "  " << program << " -p \"Hello\" -l http:http://localhost:8080\n"
        << std::endl;
}

void printList(const std::string& title, const std::vector<std::string>& items) {
    std::cout << title << ":\n";
    for (const auto& item : items) {
        std::cout << "  " << item << "\n";
    }
    std::cout << std::endl;
}

bool report(const std::shared_ptr<Vox::VoiceResult>& result, const std::string& output_file) {
    if (!result || !result->IsSuccess()) {
        std::cerr << "处理失败";
        if (result) {
            std::cerr << " [" << result->GetCode() << "]: " << result->GetMessage();
            if (result->GetEffectPosition() > 0) {
                std::cerr << " (效果 #" << result->GetEffectPosition() << ")";
            }
            for (const auto& e : result->GetErrors()) {
                std::cerr << "\n  - " << e;
            }
        }
        std::cerr << std::endl;
        return false;
    }

    // 显示信息
    std::cout << "格式: " << result->GetFormat() << std::endl;
    std::cout << "采样率: " << result->GetSampleRate() << " Hz" << std::endl;
    std::cout << "时长: " << result->GetDurationMs() << " ms" << std::endl;
    std::cout << "处理步骤:" << std::endl;
    for (const auto& step : result->GetHistory()) {
        std::cout << "  " << step << std::endl;
    }

    // 保存文件
    if (result->SaveToFile(output_file)) {
        std::cout << "已保存: " << output_file << std::endl;
        return true;
    }
    std::cerr << "保存失败: " << output_file << std::endl;
    return false;
}

int main(int argc, char* argv[]) {
    std::string text;
    std::string engine_spec = "tone";
    std::string preset = "professional_male";
    std::string transform;
    std::string input_file;
    std::string store_dir;
    std::string output_file = "output.wav";
    std::string overrides_json;
    bool has_pitch = false;
    float pitch = 0.0f;
    bool list_only = false;
    Vox::SpeakOptions options;

    // 解析参数
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "--list") == 0) {
            list_only = true;
        } else if (strcmp(argv[i], "-p") == 0 && i + 1 < argc) {
            text = argv[++i];
        } else if (strcmp(argv[i], "-l") == 0 && i + 1 < argc) {
            engine_spec = argv[++i];
        } else if (strcmp(argv[i], "-v") == 0 && i + 1 < argc) {
            preset = argv[++i];
        } else if (strcmp(argv[i], "--pitch") == 0 && i + 1 < argc) {
            pitch = std::stof(argv[++i]);
            has_pitch = true;
        } else if (strcmp(argv[i], "--overrides") == 0 && i + 1 < argc) {
            overrides_json = argv[++i];
        } else if (strcmp(argv[i], "-e") == 0 && i + 1 < argc) {
            options.emotion = argv[++i];
        } else if (strcmp(argv[i], "-i") == 0 && i + 1 < argc) {
            options.emotion_intensity = std::stof(argv[++i]);
        } else if (strcmp(argv[i], "-f") == 0 && i + 1 < argc) {
            options.effects.push_back(argv[++i]);
        } else if (strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            transform = argv[++i];
        } else if (strcmp(argv[i], "--in") == 0 && i + 1 < argc) {
            input_file = argv[++i];
        } else if (strcmp(argv[i], "--store") == 0 && i + 1 < argc) {
            store_dir = argv[++i];
        } else if (strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            output_file = argv[++i];
        }
    }

    // 创建配置
    Vox::VoiceConfig config = Vox::VoiceConfig::InMemory();
    if (engine_spec.rfind("http:", 0) == 0) {
        config = Vox::VoiceConfig::Http(engine_spec.substr(5)).withStoragePath("");
    } else if (engine_spec != "tone") {
        std::cerr << "错误: 未知引擎 '" << engine_spec << "'\n"
            << "可用引擎: tone, http:<endpoint>\n";
        return 1;
    }
    if (!store_dir.empty()) {
        config = config.withStoragePath(store_dir);
    }

    std::cout << "初始化引擎 (" << engine_spec << ")..." << std::endl;
    Vox::VoiceStudio studio(config);

    if (list_only) {
        printList("预设", studio.ListPresets());
        printList("情绪", studio.ListEmotions());
        printList("效果", studio.ListEffects());
        printList("变声预设", studio.ListTransforms());
        printList("引擎", Vox::VoiceStudio::ListEngines());
        return 0;
    }

    // 变声模式不需要档案
    if (!transform.empty()) {
        if (input_file.empty()) {
            std::cerr << "错误: -t 需要 --in 指定输入文件" << std::endl;
            return 1;
        }
        return report(studio.Transform(input_file, transform), output_file) ? 0 : 1;
    }

    // 创建音色
    Vox::VoiceOverrides overrides;
    if (!overrides_json.empty()) {
        auto parsed = Vox::VoiceStudio::ParseOverrides(overrides_json, overrides);
        if (!parsed.IsSuccess()) {
            std::cerr << "错误: 覆盖字段无效 [" << parsed.code << "]: " << parsed.message << std::endl;
            for (const auto& e : parsed.errors) {
                std::cerr << "  - " << e << std::endl;
            }
            return 1;
        }
    }
    if (has_pitch) {
        overrides = overrides.withPitch(pitch);
    }
    Vox::VoiceInfo voice;
    auto status = studio.CreateVoice("demo", preset, overrides, voice);
    if (!status.IsSuccess()) {
        std::cerr << "创建音色失败 [" << status.code << "]: " << status.message << std::endl;
        for (const auto& e : status.errors) {
            std::cerr << "  - " << e << std::endl;
        }
        return 1;
    }
    std::cout << "音色: " << voice.profile_id << " (" << preset << ", pitch=" << voice.pitch
              << ", speed=" << voice.speed << ")" << std::endl;

    if (!input_file.empty()) {
        return report(studio.Process(input_file, voice.profile_id, options), output_file) ? 0 : 1;
    }

    if (!studio.IsInitialized()) {
        std::cerr << "引擎初始化失败!" << std::endl;
        return 1;
    }
    std::cout << "引擎: " << studio.GetEngineName() << std::endl;
    std::cout << std::endl;

    if (!text.empty()) {
        return report(studio.Speak(text, voice.profile_id, options), output_file) ? 0 : 1;
    }

    // 交互模式
    std::cout << "进入交互模式，输入文本后按 Enter 合成 (输入 q 退出)" << std::endl;
    std::cout << "----------------------------------------" << std::endl;

    std::string line;
    int count = 0;
    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        if (line == "q" || line == "quit" || line == "exit") {
            std::cout << "再见!" << std::endl;
            break;
        }

        // 生成输出文件名
        std::string out = output_file;
        if (count > 0) {
            size_t dot = out.rfind('.');
            if (dot != std::string::npos) {
                out = out.substr(0, dot) + "_" + std::to_string(count) + out.substr(dot);
            } else {
                out = out + "_" + std::to_string(count);
            }
        }

        report(studio.Speak(line, voice.profile_id, options), out);
        std::cout << "> " << std::flush;
        count++;
    }

    return 0;
}
