#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <sstream>
#include <iomanip>

namespace auctionheat {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;
    
    // Relative paths resolve against the executable directory
    std::filesystem::path logs_path;
    if (std::filesystem::path(log_dir).is_absolute()) {
        logs_path = log_dir;
    } else {
        logs_path = utils::PathUtils::resolveRelativePath(log_dir);
    }
    
    std::filesystem::create_directories(logs_path);
    
    try {
        // stderr keeps stdout clean for --json output
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");
        
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logs_path.string() + "/auctionheat.log", 1024 * 1024 * 10, 3
        );
        
        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);
        
        ranking_logger_ = spdlog::daily_logger_mt("ranking", logs_path.string() + "/rankings.log");
        ranking_logger_->set_pattern("%v");
        
        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());
        
    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::logRanking(const std::string& trade_date, int count, double avg_heat,
                        double alpha_input, double alpha_effective, const std::string& regime) {
    if (ranking_logger_) {
        std::ostringstream oss;
        oss << trade_date << "," << count << ","
            << std::fixed << std::setprecision(2) << avg_heat << ","
            << std::fixed << std::setprecision(4) << alpha_input << ","
            << std::fixed << std::setprecision(4) << alpha_effective << ","
            << regime;
        ranking_logger_->info(oss.str());
    }
}

} // namespace auctionheat
