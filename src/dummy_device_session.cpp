// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include "hardware-key-qt/dummy_device_session.h"
#include <QDebug>

namespace HardwareKey {

namespace {

// 20-byte HMAC-SHA1 sized payload, the shape of a challenge-response answer
const QByteArray DEFAULT_RESPONSE = QByteArray::fromHex(
    "0102030405060708090a0b0c0d0e0f1011121314" "9000");

} // namespace

DummyDeviceSession::DummyDeviceSession()
    : m_fixedResponse(DEFAULT_RESPONSE)
{
}

DummyDeviceSession::DummyDeviceSession(const QByteArray& fixedResponse)
    : m_fixedResponse(fixedResponse)
{
}

QByteArray DummyDeviceSession::transmit(const QByteArray& apdu)
{
    ++m_transmitCount;
    qDebug() << "DummyDeviceSession: transmit" << apdu.toHex() << "->" << m_fixedResponse.toHex();
    return m_fixedResponse;
}

} // namespace HardwareKey
