#include "fixtures.hpp"

#include <regex>
#include <string>

namespace practicedb::seed {

namespace {

// Replaces {{day:N}} with the date N days from today.
std::string RenderDates(const std::string& json, util::TimePoint today) {
  static const std::regex kDayToken(R"(\{\{day:(-?\d+)\}\})");

  std::string                out;
  std::string::const_iterator last = json.begin();
  for (std::sregex_iterator it(json.begin(), json.end(), kDayToken), end; it != end; ++it) {
    out.append(last, (*it)[0].first);
    out += util::FormatDate(today, std::stoi((*it)[1].str()));
    last = (*it)[0].second;
  }
  out.append(last, json.end());
  return out;
}

std::vector<document::Document> ParseList(const std::string& json) {
  document::Value list;
  document::FromJson(json, &list);
  return document::ToDocuments(list);
}

} // namespace

std::vector<document::Document> UserFixtures() {
  return ParseList(R"([
    {"id": "doc_1", "githubId": "gh-1001", "email": "sarah.ahmed@clinic.sa", "name": "Dr. Sarah Ahmed", "role": "doctor",
     "specialization": "Internal Medicine", "licenseNumber": "SCFHS-100231", "department": "Internal Medicine", "isActive": true,
     "preferences": {"theme": "light", "language": "en", "notifications": {"email": true, "sms": true, "push": true}, "defaultView": "dashboard"}},
    {"id": "doc_2", "githubId": "gh-1002", "email": "khalid.salman@clinic.sa", "name": "Dr. Khalid Bin Salman", "role": "doctor",
     "specialization": "Cardiology", "licenseNumber": "SCFHS-100488", "department": "Cardiology", "isActive": true,
     "preferences": {"theme": "dark", "language": "ar", "notifications": {"email": true, "sms": false, "push": true}, "defaultView": "appointments"}},
    {"id": "nurse_1", "githubId": "gh-1003", "email": "layla.hamad@clinic.sa", "name": "Layla Hamad", "role": "nurse",
     "department": "Internal Medicine", "isActive": true,
     "preferences": {"theme": "system", "language": "en", "notifications": {"email": false, "sms": true, "push": true}, "defaultView": "patients"}}
  ])");
}

std::vector<document::Document> PatientFixtures() {
  return ParseList(R"([
    {"id": "patient_1", "mrn": "MRN-2024-001", "name": "Ahmed Al-Rashid", "nameAr": "أحمد الراشد", "age": 45, "dateOfBirth": "1979-03-15",
     "gender": "male", "nationalId": "1234567890", "phone": "+966501234567", "email": "ahmed.rashid@email.com",
     "address": "King Fahd Road, Riyadh, Saudi Arabia",
     "emergencyContact": {"name": "Fatima Al-Rashid", "phone": "+966509876543", "relationship": "Spouse"},
     "bloodType": "O+", "allergies": ["Penicillin", "Peanuts"], "conditions": ["Hypertension", "Type 2 Diabetes"],
     "medications": [
       {"name": "Lisinopril", "dosage": "10mg", "frequency": "Once daily", "startDate": "2023-01-15", "prescribedBy": "Dr. Sarah Ahmed"},
       {"name": "Metformin", "dosage": "500mg", "frequency": "Twice daily", "startDate": "2023-03-20", "prescribedBy": "Dr. Sarah Ahmed"}],
     "insuranceInfo": {"provider": "Bupa Arabia", "policyNumber": "BUPA-2024-123456", "validFrom": "2024-01-01", "validTo": "2024-12-31",
                       "coverageType": "comprehensive", "nphiesId": "NPH-123456"},
     "lastVisit": "2024-11-20", "status": "stable"},
    {"id": "patient_2", "mrn": "MRN-2024-002", "name": "Sara Mohammed", "nameAr": "سارة محمد", "age": 32, "dateOfBirth": "1992-07-22",
     "gender": "female", "nationalId": "2345678901", "phone": "+966559876543", "email": "sara.mohammed@email.com",
     "address": "Al-Olaya District, Riyadh, Saudi Arabia",
     "emergencyContact": {"name": "Mohammed Al-Zahrani", "phone": "+966551234567", "relationship": "Brother"},
     "bloodType": "A+", "allergies": ["Aspirin"], "conditions": ["Diabetes Type 2"],
     "medications": [
       {"name": "Metformin", "dosage": "850mg", "frequency": "Twice daily", "startDate": "2024-02-10", "prescribedBy": "Dr. Omar Hassan"}],
     "insuranceInfo": {"provider": "Tawuniya", "policyNumber": "TWN-2024-789012", "validFrom": "2024-01-01", "validTo": "2024-12-31",
                       "coverageType": "premium", "nphiesId": "NPH-789012"},
     "lastVisit": "2024-11-18", "status": "monitoring"},
    {"id": "patient_3", "mrn": "MRN-2024-003", "name": "Omar Hassan", "nameAr": "عمر حسن", "age": 28, "dateOfBirth": "1996-11-08",
     "gender": "male", "nationalId": "3456789012", "phone": "+966505551234", "email": "omar.hassan@email.com",
     "address": "Al-Malaz, Riyadh, Saudi Arabia",
     "emergencyContact": {"name": "Hassan Omar", "phone": "+966505559876", "relationship": "Father"},
     "bloodType": "B+", "allergies": [], "conditions": ["Asthma"],
     "medications": [
       {"name": "Salbutamol Inhaler", "dosage": "100mcg", "frequency": "As needed", "startDate": "2024-01-05", "prescribedBy": "Dr. Sarah Ahmed"}],
     "lastVisit": "2024-11-15", "status": "improving"},
    {"id": "patient_4", "mrn": "MRN-2024-004", "name": "Fatima Ali", "nameAr": "فاطمة علي", "age": 38, "dateOfBirth": "1986-04-30",
     "gender": "female", "nationalId": "4567890123", "phone": "+966543219876", "email": "fatima.ali@email.com",
     "address": "Al-Nakheel, Riyadh, Saudi Arabia",
     "emergencyContact": {"name": "Ali Mohammed", "phone": "+966541239876", "relationship": "Husband"},
     "bloodType": "AB-", "allergies": ["Sulfa drugs", "Latex"], "conditions": ["Heart Disease", "Hypertension"],
     "medications": [
       {"name": "Atorvastatin", "dosage": "20mg", "frequency": "Once daily", "startDate": "2023-06-15", "prescribedBy": "Dr. Khalid Bin Salman"},
       {"name": "Clopidogrel", "dosage": "75mg", "frequency": "Once daily", "startDate": "2023-06-15", "prescribedBy": "Dr. Khalid Bin Salman"}],
     "insuranceInfo": {"provider": "Medgulf", "policyNumber": "MGF-2024-345678", "validFrom": "2024-01-01", "validTo": "2024-12-31",
                       "coverageType": "comprehensive"},
     "lastVisit": "2024-11-22", "status": "critical"},
    {"id": "patient_5", "mrn": "MRN-2024-005", "name": "Khalid Bin Salman", "nameAr": "خالد بن سلمان", "age": 52, "dateOfBirth": "1972-09-14",
     "gender": "male", "nationalId": "5678901234", "phone": "+966567890123", "email": "khalid.salman@email.com",
     "address": "Diplomatic Quarter, Riyadh, Saudi Arabia",
     "emergencyContact": {"name": "Salman Al-Saud", "phone": "+966567891234", "relationship": "Son"},
     "bloodType": "A-", "allergies": [], "conditions": ["Arthritis", "Hypertension"],
     "medications": [
       {"name": "Celecoxib", "dosage": "200mg", "frequency": "Twice daily", "startDate": "2024-03-01", "prescribedBy": "Dr. Omar Hassan"},
       {"name": "Amlodipine", "dosage": "5mg", "frequency": "Once daily", "startDate": "2023-09-10", "prescribedBy": "Dr. Sarah Ahmed"}],
     "lastVisit": "2024-11-10", "status": "stable"},
    {"id": "patient_6", "mrn": "MRN-2024-006", "name": "Noura Abdullah", "nameAr": "نورة عبدالله", "age": 29, "dateOfBirth": "1995-12-03",
     "gender": "female", "nationalId": "6789012345", "phone": "+966502468135", "email": "noura.abdullah@email.com",
     "address": "Al-Sahafa, Riyadh, Saudi Arabia",
     "emergencyContact": {"name": "Abdullah Al-Otaibi", "phone": "+966502461357", "relationship": "Father"},
     "bloodType": "O-", "allergies": ["Codeine"], "conditions": ["Migraine"],
     "medications": [
       {"name": "Sumatriptan", "dosage": "50mg", "frequency": "As needed", "startDate": "2024-05-20", "prescribedBy": "Dr. Sarah Ahmed"}],
     "lastVisit": "2024-11-05", "status": "improving"}
  ])");
}

std::vector<document::Document> AppointmentFixtures(util::TimePoint today) {
  return ParseList(RenderDates(R"([
    {"id": "apt_1", "patientId": "patient_1", "patientName": "Ahmed Al-Rashid", "doctorId": "doc_1", "doctorName": "Dr. Sarah Ahmed",
     "date": "{{day:0}}", "time": "09:00", "endTime": "09:30", "type": "follow-up", "status": "confirmed", "duration": 30,
     "notes": "Monthly diabetes follow-up", "chiefComplaint": "Regular checkup", "location": "Room 101",
     "reminders": [{"type": "sms", "scheduledFor": "{{day:-1}}", "sent": true, "sentAt": "{{day:-1}}"}]},
    {"id": "apt_2", "patientId": "patient_2", "patientName": "Sara Mohammed", "doctorId": "doc_1", "doctorName": "Dr. Sarah Ahmed",
     "date": "{{day:0}}", "time": "10:00", "endTime": "10:30", "type": "consultation", "status": "scheduled", "duration": 30,
     "notes": "New consultation for diabetes management", "location": "Room 101", "reminders": []},
    {"id": "apt_3", "patientId": "patient_4", "patientName": "Fatima Ali", "doctorId": "doc_2", "doctorName": "Dr. Khalid Bin Salman",
     "date": "{{day:0}}", "time": "11:00", "endTime": "11:45", "type": "emergency", "status": "in-progress", "duration": 45,
     "notes": "Cardiac evaluation - urgent", "chiefComplaint": "Chest pain", "location": "Emergency Room", "reminders": []},
    {"id": "apt_4", "patientId": "patient_3", "patientName": "Omar Hassan", "doctorId": "doc_1", "doctorName": "Dr. Sarah Ahmed",
     "date": "{{day:1}}", "time": "09:30", "endTime": "10:00", "type": "telemedicine", "status": "scheduled", "duration": 30,
     "notes": "Virtual asthma follow-up",
     "reminders": [{"type": "email", "scheduledFor": "{{day:0}}", "sent": false}]},
    {"id": "apt_5", "patientId": "patient_5", "patientName": "Khalid Bin Salman", "doctorId": "doc_1", "doctorName": "Dr. Sarah Ahmed",
     "date": "{{day:2}}", "time": "14:00", "endTime": "14:30", "type": "follow-up", "status": "scheduled", "duration": 30,
     "notes": "Arthritis medication review", "location": "Room 102", "reminders": []}
  ])",
                               today));
}

std::vector<document::Document> ClaimFixtures() {
  return ParseList(R"([
    {"id": "claim_1", "claimNumber": "CLM-2024-001", "patientId": "patient_1", "patientName": "Ahmed Al-Rashid", "patientNationalId": "1234567890",
     "insuranceId": "BUPA-2024-123456", "providerId": "PROV-001", "serviceDate": "2024-11-20", "submittedDate": "2024-11-21",
     "amount": 1500, "currency": "SAR", "status": "approved", "type": "professional", "priority": "normal",
     "services": [
       {"sequence": 1, "serviceCode": "CONS-001", "serviceName": "General Consultation", "quantity": 1, "unitPrice": 500, "totalPrice": 500, "serviceDate": "2024-11-20"},
       {"sequence": 2, "serviceCode": "LAB-001", "serviceName": "Blood Test Panel", "quantity": 1, "unitPrice": 1000, "totalPrice": 1000, "serviceDate": "2024-11-20"}],
     "diagnosis": [{"sequence": 1, "code": "E11.9", "system": "ICD-10", "description": "Type 2 Diabetes Mellitus without complications", "type": "principal"}],
     "approvedAmount": 1500, "createdBy": "doc_1"},
    {"id": "claim_2", "claimNumber": "CLM-2024-002", "patientId": "patient_2", "patientName": "Sara Mohammed", "patientNationalId": "2345678901",
     "insuranceId": "TWN-2024-789012", "providerId": "PROV-001", "serviceDate": "2024-11-18", "submittedDate": "2024-11-19",
     "amount": 2500, "currency": "SAR", "status": "pending", "type": "professional", "priority": "normal",
     "services": [
       {"sequence": 1, "serviceCode": "CONS-002", "serviceName": "Specialist Consultation", "quantity": 1, "unitPrice": 800, "totalPrice": 800, "serviceDate": "2024-11-18"},
       {"sequence": 2, "serviceCode": "IMG-001", "serviceName": "Ultrasound", "quantity": 1, "unitPrice": 1700, "totalPrice": 1700, "serviceDate": "2024-11-18"}],
     "diagnosis": [{"sequence": 1, "code": "E11.65", "system": "ICD-10", "description": "Type 2 Diabetes Mellitus with hyperglycemia", "type": "principal"}],
     "createdBy": "doc_1"},
    {"id": "claim_3", "claimNumber": "CLM-2024-003", "patientId": "patient_4", "patientName": "Fatima Ali", "patientNationalId": "4567890123",
     "insuranceId": "MGF-2024-345678", "providerId": "PROV-001", "serviceDate": "2024-11-22", "submittedDate": "2024-11-22",
     "amount": 8500, "currency": "SAR", "status": "processing", "type": "institutional", "priority": "urgent",
     "services": [
       {"sequence": 1, "serviceCode": "CARD-001", "serviceName": "Cardiac Evaluation", "quantity": 1, "unitPrice": 3000, "totalPrice": 3000, "serviceDate": "2024-11-22"},
       {"sequence": 2, "serviceCode": "ECG-001", "serviceName": "ECG Test", "quantity": 1, "unitPrice": 500, "totalPrice": 500, "serviceDate": "2024-11-22"},
       {"sequence": 3, "serviceCode": "ECHO-001", "serviceName": "Echocardiogram", "quantity": 1, "unitPrice": 5000, "totalPrice": 5000, "serviceDate": "2024-11-22"}],
     "diagnosis": [
       {"sequence": 1, "code": "I25.10", "system": "ICD-10", "description": "Atherosclerotic heart disease", "type": "principal"},
       {"sequence": 2, "code": "I10", "system": "ICD-10", "description": "Essential Hypertension", "type": "secondary"}],
     "createdBy": "doc_2"},
    {"id": "claim_4", "claimNumber": "CLM-2024-004", "patientId": "patient_1", "patientName": "Ahmed Al-Rashid",
     "insuranceId": "BUPA-2024-123456", "providerId": "PROV-001", "serviceDate": "2024-10-15", "submittedDate": "2024-10-16",
     "amount": 750, "currency": "SAR", "status": "rejected", "type": "professional", "priority": "normal",
     "services": [
       {"sequence": 1, "serviceCode": "MED-001", "serviceName": "Medication Review", "quantity": 1, "unitPrice": 750, "totalPrice": 750, "serviceDate": "2024-10-15"}],
     "diagnosis": [{"sequence": 1, "code": "I10", "system": "ICD-10", "description": "Essential Hypertension", "type": "principal"}],
     "rejectionReason": "Service not covered under current policy", "createdBy": "doc_1"}
  ])");
}

std::vector<document::Document> MedicalRecordFixtures(util::TimePoint today) {
  return ParseList(RenderDates(R"([
    {"id": "record_1", "patientId": "patient_1", "date": "{{day:-30}}", "type": "consultation", "diagnosis": "Type 2 Diabetes Mellitus",
     "treatment": "Continue Metformin 500mg twice daily", "notes": "HbA1c trending down, diet adherence improving",
     "vitals": {"bloodPressure": "138/88", "heartRate": 76, "temperature": 36.8, "oxygenSaturation": 98, "weight": 84, "height": 175,
                "bmi": 27.4, "recordedAt": "{{day:-30}}"},
     "doctorId": "doc_1", "doctorName": "Dr. Sarah Ahmed"},
    {"id": "record_2", "patientId": "patient_4", "date": "{{day:-7}}", "type": "procedure", "diagnosis": "Atherosclerotic heart disease",
     "treatment": "Echocardiogram and medication adjustment", "notes": "Ejection fraction 50%, refer for stress test",
     "vitals": {"bloodPressure": "150/95", "heartRate": 92, "temperature": 37.0, "respiratoryRate": 18, "weight": 70, "height": 162,
                "bmi": 26.7, "recordedAt": "{{day:-7}}"},
     "doctorId": "doc_2", "doctorName": "Dr. Khalid Bin Salman"},
    {"id": "record_3", "patientId": "patient_3", "date": "{{day:-14}}", "type": "prescription", "diagnosis": "Asthma",
     "treatment": "Salbutamol inhaler as needed", "notes": "Mild exercise-induced symptoms",
     "doctorId": "doc_1", "doctorName": "Dr. Sarah Ahmed"}
  ])",
                               today));
}

std::vector<document::Document> LabResultFixtures(util::TimePoint today) {
  return ParseList(RenderDates(R"([
    {"id": "lab_1", "patientId": "patient_1", "testName": "HbA1c", "testCode": "LAB-HBA1C", "result": "7.2", "unit": "%",
     "normalRange": "4.0-5.6", "status": "abnormal", "date": "{{day:-30}}", "performedBy": "Central Lab"},
    {"id": "lab_2", "patientId": "patient_2", "testName": "Fasting Glucose", "testCode": "LAB-FBG", "result": "145", "unit": "mg/dL",
     "normalRange": "70-100", "status": "abnormal", "date": "{{day:-2}}", "performedBy": "Central Lab"},
    {"id": "lab_3", "patientId": "patient_4", "testName": "Troponin I", "testCode": "LAB-TROP", "result": "0.02", "unit": "ng/mL",
     "normalRange": "0.00-0.04", "status": "normal", "date": "{{day:-7}}", "performedBy": "Emergency Lab"}
  ])",
                               today));
}

std::vector<document::Document> NotificationFixtures(util::TimePoint now) {
  const auto read_at = util::ToIso8601(now);
  auto       docs    = ParseList(R"([
    {"userId": "doc_1", "type": "appointment-reminder", "title": "Upcoming Appointment",
     "message": "You have an appointment with Ahmed Al-Rashid at 09:00 AM", "isRead": false, "priority": "normal"},
    {"userId": "doc_1", "type": "urgent-patient", "title": "Critical Patient Alert",
     "message": "Fatima Ali requires immediate attention - cardiac evaluation needed", "isRead": false, "priority": "urgent"},
    {"userId": "doc_1", "type": "claim-status", "title": "Claim Approved",
     "message": "Claim CLM-2024-001 for Ahmed Al-Rashid has been approved - SAR 1,500", "isRead": true, "priority": "normal"},
    {"userId": "doc_1", "type": "lab-results", "title": "Lab Results Available",
     "message": "New lab results available for patient Sara Mohammed", "isRead": false, "priority": "high"}
  ])");
  document::SetString(docs[2], "readAt", read_at);
  return docs;
}

} // namespace practicedb::seed
