#include "LandmarkParser.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>

namespace
{

bool parseLandmark(const QJsonValue &value, Landmark &out)
{
    if (!value.isObject())
        return false;

    const QJsonObject pt = value.toObject();
    const QJsonValue x = pt.value("x");
    const QJsonValue y = pt.value("y");
    if (!x.isDouble() || !y.isDouble())
        return false;

    out.x = x.toDouble();
    out.y = y.toDouble();

    // Some detectors only emit 2D points
    const QJsonValue z = pt.value("z");
    if (z.isUndefined() || z.isNull())
        out.z = 0.0;
    else if (z.isDouble())
        out.z = z.toDouble();
    else
        return false;
    return true;
}

}

namespace LandmarkParser
{

bool parseFrame(const QByteArray &line, QVector<HandInfo> &hands, QString *error)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(line, &err);

    if (err.error != QJsonParseError::NoError)
    {
        if (error)
            *error = err.errorString();
        return false;
    }

    if (!doc.isObject())
    {
        if (error)
            *error = QStringLiteral("frame is not a JSON object");
        return false;
    }

    const QJsonArray handsArr = doc.object().value("hands").toArray();

    QVector<HandInfo> parsed;
    parsed.reserve(handsArr.size());

    for (const QJsonValue &val : handsArr)
    {
        const QJsonObject obj = val.toObject();
        HandInfo h;
        h.handedness = obj.value("handedness").toString();
        h.score = float(obj.value("score").toDouble(1.0));

        const QJsonArray points = obj.value("landmarks").toArray();
        h.landmarks.reserve(points.size());
        for (const QJsonValue &p : points)
        {
            Landmark lm;
            if (!parseLandmark(p, lm))
            {
                // An empty hand is never well formed, so the router drops it
                h.landmarks.clear();
                break;
            }
            h.landmarks.append(lm);
        }

        parsed.append(h);
    }

    hands = parsed;
    return true;
}

}
