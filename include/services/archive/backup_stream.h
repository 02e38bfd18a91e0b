#pragma once

#include <cstddef>
#include <fstream>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

#include "common/result.h"
#include "models/frame.h"

namespace chat_backup::services::archive {

// 备份输出流，逐帧写入
class BackupOutputStream {
public:
    virtual ~BackupOutputStream() = default;

    virtual common::Result<void> WriteFrame(const models::Frame& frame) = 0;
};

// 备份输入流，逐帧读取
class BackupInputStream {
public:
    virtual ~BackupInputStream() = default;

    // 流结束时返回空值，数据无法解析时返回错误
    virtual common::Result<std::optional<models::Frame>> ReadFrame() = 0;
};

// 每行一个JSON对象的备份格式
class JsonlBackupOutputStream : public BackupOutputStream {
public:
    explicit JsonlBackupOutputStream(std::ostream& output);

    common::Result<void> WriteFrame(const models::Frame& frame) override;

    size_t GetFramesWritten() const { return frames_written_; }

private:
    std::ostream& output_;
    size_t frames_written_ = 0;
};

class JsonlBackupInputStream : public BackupInputStream {
public:
    explicit JsonlBackupInputStream(std::istream& input);

    common::Result<std::optional<models::Frame>> ReadFrame() override;

    size_t GetLineNumber() const { return line_number_; }

private:
    std::istream& input_;
    size_t line_number_ = 0;
};

// 备份文件先写入 <path>.tmp，Commit 成功后才替换目标文件
// 未提交时析构删除临时文件，目标文件保持不变
class BackupFileWriter {
public:
    explicit BackupFileWriter(std::string path);
    ~BackupFileWriter();

    BackupFileWriter(const BackupFileWriter&) = delete;
    BackupFileWriter& operator=(const BackupFileWriter&) = delete;

    bool IsOpen() const { return output_.is_open(); }
    std::ostream& GetStream() { return output_; }
    const std::string& GetTempPath() const { return temp_path_; }

    common::Result<void> Commit();

private:
    void Discard();

    std::string path_;
    std::string temp_path_;
    std::ofstream output_;
    bool committed_ = false;
};

} // namespace chat_backup::services::archive
