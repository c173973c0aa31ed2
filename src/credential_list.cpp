#include "credential_list.h"

Credential CredentialList::at(quint64 index) const {
    const quint64 nPass = quint64(passwords_.size());
    Q_ASSERT(index < size());
    return { usernames_.at(int(index / nPass)), passwords_.at(int(index % nPass)) };
}
