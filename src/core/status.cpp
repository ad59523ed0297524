#include "status.hpp"

SubjectStatus ConnStatus::get_subject(DeploySubject subject) const {
    auto it = subjects.find(subject);
    if (it == subjects.end()) return SubjectStatus{};
    return it->second;
}

void ConnStatus::set_subject(DeploySubject subject, const SubjectStatus& status) {
    subjects[subject] = status;
}
