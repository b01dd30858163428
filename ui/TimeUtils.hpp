// Display helpers for listings and metadata.
#pragma once
#include <QDateTime>
#include <QLocale>
#include <QString>

#include <cstdint>

namespace filesshui {

// Epoch seconds in LOCAL time, short system-locale format.
inline QString localShortTime(std::uint64_t secs) {
    if (secs == 0)
        return QStringLiteral("-");
    const QDateTime dt = QDateTime::fromSecsSinceEpoch((qint64)secs);
    if (!dt.isValid())
        return QStringLiteral("-");
    return QLocale::system().toString(dt, QLocale::ShortFormat);
}

inline QString humanSize(std::uint64_t bytes) {
    return QLocale::system().formattedDataSize((qint64)bytes);
}

// "drwxr-xr-x" style rendering of POSIX mode bits.
inline QString modeString(std::uint32_t mode) {
    QString s(10, QLatin1Char('-'));
    switch (mode & 0170000) {
    case 0040000:
        s[0] = QLatin1Char('d');
        break;
    case 0120000:
        s[0] = QLatin1Char('l');
        break;
    default:
        break;
    }
    static const char rwx[] = "rwxrwxrwx";
    for (int i = 0; i < 9; ++i) {
        if (mode & (0400u >> i))
            s[i + 1] = QLatin1Char(rwx[i]);
    }
    return s;
}

} // namespace filesshui
