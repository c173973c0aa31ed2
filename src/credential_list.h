#pragma once

#include <QString>
#include <QStringList>

#include <utility>

struct Credential {
    QString username;
    QString password;

    bool operator==(const Credential& o) const { return username == o.username && password == o.password; }
};

// usernames × passwords 조합. 인덱스로 바로 계산하므로 조합 목록을 만들지 않는다.
// 순서: username 이 바깥, password 가 안쪽
class CredentialList {
public:
    CredentialList() = default;
    CredentialList(QStringList usernames, QStringList passwords)
        : usernames_(std::move(usernames)), passwords_(std::move(passwords)) {}

    quint64 size() const { return quint64(usernames_.size()) * quint64(passwords_.size()); }
    bool isEmpty() const { return size() == 0; }
    Credential at(quint64 index) const;

    const QStringList& usernames() const { return usernames_; }
    const QStringList& passwords() const { return passwords_; }

private:
    QStringList usernames_;
    QStringList passwords_;
};
