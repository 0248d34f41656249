#include "appstate.h"

AppState::AppState(QObject *parent)
    : QObject(parent)
    , m_state(ProgramState::Idle)
{
}

// Меняет состояние и посылает сигнал только если изменилось
void AppState::setState(ProgramState newState)
{
    if (m_state != newState) {
        m_previousState = m_state;     //сохраняем текущее перед сменой
        m_state = newState;
        emit stateChanged(m_state);
    }
}

const char* AppState::stateKey(ProgramState state)
{
    switch (state) {
    case ProgramState::Idle:           return "mode_idle";
    case ProgramState::Calibrating:    return "mode_calibrating";
    case ProgramState::Measuring:      return "mode_measuring";
    case ProgramState::GroupSelecting: return "mode_group";
    case ProgramState::PickingColor:   return "mode_pick_color";
    }
    return "mode_idle";
}
