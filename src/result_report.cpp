#include "result_report.h"
#include "app_log.h"

#include <QDateTime>
#include <QSaveFile>

#include <tinyxml2.h>

#include <algorithm>

using namespace tinyxml2;

static const char* streamText(StreamCheck s){
    switch(s){
    case StreamCheck::Ok:     return "ok";
    case StreamCheck::Failed: return "failed";
    case StreamCheck::NotChecked: break;
    }
    return nullptr;
}

static void setText(XMLElement* e, const char* name, const QString& v){
    e->SetAttribute(name, v.toUtf8().constData());
}

QByteArray renderXmlReport(const RunTally& tally, std::vector<ReportEntry> entries, const QString& path){
    std::sort(entries.begin(), entries.end(), [](const ReportEntry& a, const ReportEntry& b){
        const auto& x = a.found; const auto& y = b.found;
        if(x.target != y.target) return x.target < y.target;
        if(x.credential.username != y.credential.username) return x.credential.username < y.credential.username;
        return x.credential.password < y.credential.password;
    });

    XMLDocument doc;
    doc.InsertFirstChild(doc.NewDeclaration());
    XMLElement* root = doc.NewElement("rtspaudit");
    doc.InsertEndChild(root);
    setText(root, "generated", QDateTime::currentDateTimeUtc().toString(Qt::ISODate));

    XMLElement* s = root->InsertNewChildElement("summary");
    s->SetAttribute("scheduled", int64_t(tally.scheduled));
    s->SetAttribute("completed", int64_t(tally.completed));
    s->SetAttribute("valid", int64_t(tally.valid));
    s->SetAttribute("invalid", int64_t(tally.invalid));
    s->SetAttribute("network_errors", int64_t(tally.networkErrors));
    s->SetAttribute("protocol_errors", int64_t(tally.protocolErrors));
    s->SetAttribute("skipped", int64_t(tally.skipped));
    s->SetAttribute("elapsed_ms", int64_t(tally.elapsedMs));
    s->SetAttribute("interrupted", tally.interrupted);

    for(const ReportEntry& entry : entries){
        const FoundCredential& f = entry.found;
        XMLElement* c = root->InsertNewChildElement("credential");
        setText(c, "address", f.target.host());
        c->SetAttribute("port", int(f.target.port));
        setText(c, "username", f.credential.username);
        setText(c, "password", f.credential.password);
        c->SetAttribute("noauth", f.noAuthRequired);
        setText(c, "url", f.url(path));
        if(const char* st = streamText(entry.stream)) c->SetAttribute("stream", st);
    }

    XMLPrinter printer;
    doc.Print(&printer);
    return QByteArray(printer.CStr(), printer.CStrSize() - 1);
}

bool writeXmlReport(const QString& file, const RunTally& tally, std::vector<ReportEntry> entries,
                    const QString& path, QString* errOut)
{
    const int count = int(entries.size());
    const QByteArray xml = renderXmlReport(tally, std::move(entries), path);
    QSaveFile out(file);
    if(!out.open(QIODevice::WriteOnly) || out.write(xml) != xml.size() || !out.commit()){
        if(errOut) *errOut = QString("cannot write report %1: %2").arg(file, out.errorString());
        return false;
    }
    qCInfo(lcApp) << "report written to" << file << "(" << count << "credentials )";
    return true;
}
