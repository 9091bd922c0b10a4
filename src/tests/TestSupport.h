#ifndef TESTSUPPORT_H
#define TESTSUPPORT_H

#include "Cleaner.h"
#include "GeoPoint.h"
#include "Logger.h"
#include <sstream>
#include <string>

/**
 * Routes the global logger into a buffer for the lifetime of the object.
 */
class CapturedLog {
public:
    explicit CapturedLog(LogLevel threshold = LogLevel::Debug) : logger(buffer, threshold) {
        Logger::set_global(&logger);
    }
    ~CapturedLog() { Logger::set_global(nullptr); }

    std::string text() const { return buffer.str(); }

private:
    std::ostringstream buffer;
    Logger logger;
};

inline const GeoPoint MIDTOWN(40.75, -73.99);

inline Cleaner make_cleaner(const std::string& id, GeoPoint at, double radius = 10.0,
                            double score = 0.5) {
    return Cleaner(id, at, score, radius);
}

#endif // TESTSUPPORT_H
