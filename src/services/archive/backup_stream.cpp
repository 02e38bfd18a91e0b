#include "services/archive/backup_stream.h"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/utils/string_utils.h"

namespace chat_backup::services::archive {

using json = nlohmann::json;

JsonlBackupOutputStream::JsonlBackupOutputStream(std::ostream& output)
    : output_(output) {
}

common::Result<void> JsonlBackupOutputStream::WriteFrame(const models::Frame& frame) {
    std::string line;
    try {
        line = frame.ToJson().dump();
    } catch (const json::exception& e) {
        return common::Result<void>::Error(std::string("无法序列化备份帧: ") + e.what());
    }

    output_ << line << '\n';
    if (!output_) {
        return common::Result<void>::Error("写入备份流失败");
    }

    ++frames_written_;
    return common::Result<void>::Ok();
}

JsonlBackupInputStream::JsonlBackupInputStream(std::istream& input)
    : input_(input) {
}

common::Result<std::optional<models::Frame>> JsonlBackupInputStream::ReadFrame() {
    using ResultType = common::Result<std::optional<models::Frame>>;

    std::string line;
    while (std::getline(input_, line)) {
        ++line_number_;

        if (core::utils::StringUtils::Trim(line).empty()) {
            continue;
        }

        try {
            return ResultType::Ok(models::Frame::FromJson(json::parse(line)));
        } catch (const json::exception& e) {
            spdlog::debug("Malformed backup frame at line {}: {}", line_number_, e.what());
            return ResultType::Error("第 " + std::to_string(line_number_) + " 行数据无效: " + e.what());
        } catch (const std::invalid_argument& e) {
            spdlog::debug("Unknown backup frame at line {}: {}", line_number_, e.what());
            return ResultType::Error("第 " + std::to_string(line_number_) + " 行数据无效: " + e.what());
        }
    }

    if (input_.bad()) {
        return ResultType::Error("读取备份流失败");
    }

    return ResultType::Ok(std::nullopt);
}

BackupFileWriter::BackupFileWriter(std::string path)
    : path_(std::move(path)),
      temp_path_(path_ + ".tmp"),
      output_(temp_path_, std::ios::out | std::ios::trunc) {
}

BackupFileWriter::~BackupFileWriter() {
    if (!committed_) {
        Discard();
    }
}

common::Result<void> BackupFileWriter::Commit() {
    if (committed_) {
        return common::Result<void>::Ok();
    }

    output_.close();
    if (output_.fail()) {
        Discard();
        return common::Result<void>::Error("写入临时备份文件失败: " + temp_path_);
    }

    std::error_code ec;
    std::filesystem::rename(temp_path_, path_, ec);
    if (ec) {
        Discard();
        return common::Result<void>::Error("无法替换备份文件 " + path_ + ": " + ec.message());
    }

    committed_ = true;
    return common::Result<void>::Ok();
}

void BackupFileWriter::Discard() {
    if (output_.is_open()) {
        output_.close();
    }

    std::error_code ec;
    if (std::filesystem::remove(temp_path_, ec)) {
        spdlog::debug("Removed unfinished backup file {}", temp_path_);
    } else if (ec) {
        spdlog::warn("Failed to remove {}: {}", temp_path_, ec.message());
    }
}

} // namespace chat_backup::services::archive
