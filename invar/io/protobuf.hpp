#pragma once

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <google/protobuf/io/gzip_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <invar/util/util.hpp>

namespace invar {
namespace protobuf {

class InFile : noncopyable {
    const std::string m_filename;
    const int m_fid;
    google::protobuf::io::FileInputStream* m_file;
    google::protobuf::io::GzipInputStream* m_gzip;

   public:
    explicit InFile(const std::string& filename)
        : m_filename(filename), m_fid(open(filename.c_str(), O_RDONLY)) {
        INVAR_ASSERT(m_fid != -1, "failed to open file " << filename);
        m_file = new google::protobuf::io::FileInputStream(m_fid);
        m_gzip = new google::protobuf::io::GzipInputStream(m_file);
    }

    ~InFile() {
        delete m_gzip;
        delete m_file;
        close(m_fid);
    }

    const std::string& filename() const { return m_filename; }

    template <class Message>
    void read(Message& message) {
        bool info = message.ParseFromZeroCopyStream(m_gzip);
        INVAR_ASSERT(info, "file ended early: " << m_filename);
    }
};

class OutFile : noncopyable {
    const std::string m_filename;
    const int m_fid;
    google::protobuf::io::FileOutputStream* m_file;
    google::protobuf::io::GzipOutputStream* m_gzip;

   public:
    explicit OutFile(const std::string& filename)
        : m_filename(filename),
          m_fid(open(filename.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0664)) {
        INVAR_ASSERT(m_fid != -1, "failed to open file " << filename);
        m_file = new google::protobuf::io::FileOutputStream(m_fid);
        m_gzip = new google::protobuf::io::GzipOutputStream(m_file);
    }

    ~OutFile() {
        delete m_gzip;
        delete m_file;
        close(m_fid);
    }

    const std::string& filename() const { return m_filename; }

    template <class Message>
    void write(const Message& message) {
        INVAR_ASSERT1(message.IsInitialized(), "message not initialized");
        bool info = message.SerializeToZeroCopyStream(m_gzip);
        INVAR_ASSERT(info, "failed to write to " << m_filename);
    }
};

}  // namespace protobuf
}  // namespace invar
