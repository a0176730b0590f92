#pragma once

#include <QObject>
#include <QImage>
#include <QString>
#include <memory>

struct VideoInfo {
    int width = 0;
    int height = 0;
    double fps = 0.0;
    double duration = 0.0;  // seconds
    QString codecName;
    bool hasAudio = false;
};

// Sequential FFmpeg video decoder producing RGB32 frames.
class VideoDecoder : public QObject {
    Q_OBJECT
public:
    explicit VideoDecoder(QObject* parent = nullptr);
    ~VideoDecoder();

    bool open(const QString& filePath);
    void close();
    bool isOpen() const { return m_isOpen; }

    // Next frame in decode order; false at end of stream or on error.
    bool decodeNextFrame(QImage& image, double& pts);

    // Seeks to the keyframe at or before seconds; following frames start there.
    bool seek(double seconds);

    const VideoInfo& info() const { return m_info; }
    QString errorString() const { return m_error; }

private:
    bool fail(const QString& message, int code = 0);

    bool m_isOpen = false;
    VideoInfo m_info;
    QString m_error;

    struct FFmpegContext;
    std::unique_ptr<FFmpegContext> m_ctx;
};
